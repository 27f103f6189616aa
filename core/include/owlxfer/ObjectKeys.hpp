// Helpers for building and taking apart object keys. Keys use '/' as the
// folder separator; folder keys end with '/'.
#pragma once
#include <string>

namespace owlxfer {

bool isFolderKey(const std::string &key);

// "a/b/c.txt" -> "a/b/", "a/b/" -> "a/", "c.txt" -> "".
std::string parentPrefix(const std::string &key);

// Last path component without the trailing '/'.
std::string leafName(const std::string &key);

// Normalizes `prefix` to end with '/' (empty stays empty).
std::string folderPrefix(const std::string &prefix);

// prefix + "/" + relative, tolerating an empty prefix or a trailing '/'.
std::string joinKey(const std::string &prefix, const std::string &relative);

// True if `name` is a usable single path component: non-empty and free of
// \ / : * ? " < > |.
bool isValidObjectName(const std::string &name);

// True if `key` equals `folder` or lies below it. `folder` must end in '/'.
bool isWithinFolder(const std::string &key, const std::string &folder);

// Applies a rename pattern containing "{n}" to `key`: before the extension
// for files ("a/photo.jpg" -> "a/photo(2).jpg"), before the trailing slash
// for folders ("a/b/" -> "a/b(2)/"). An empty pattern means "({n})".
std::string applyRenamePattern(const std::string &key,
                               const std::string &pattern, int number);

} // namespace owlxfer

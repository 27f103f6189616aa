#include "owlxfer/ObjectKeys.hpp"

namespace owlxfer {

bool isFolderKey(const std::string &key) {
    return !key.empty() && key.back() == '/';
}

static std::string withoutTrailingSlash(const std::string &key) {
    if (isFolderKey(key))
        return key.substr(0, key.size() - 1);
    return key;
}

std::string parentPrefix(const std::string &key) {
    const std::string trimmed = withoutTrailingSlash(key);
    const auto slash = trimmed.rfind('/');
    if (slash == std::string::npos)
        return {};
    return trimmed.substr(0, slash + 1);
}

std::string leafName(const std::string &key) {
    const std::string trimmed = withoutTrailingSlash(key);
    const auto slash = trimmed.rfind('/');
    if (slash == std::string::npos)
        return trimmed;
    return trimmed.substr(slash + 1);
}

std::string folderPrefix(const std::string &prefix) {
    if (prefix.empty() || isFolderKey(prefix))
        return prefix;
    return prefix + "/";
}

std::string joinKey(const std::string &prefix, const std::string &relative) {
    std::string rel = relative;
    while (!rel.empty() && rel.front() == '/')
        rel.erase(0, 1);
    return folderPrefix(prefix) + rel;
}

bool isValidObjectName(const std::string &name) {
    if (name.empty())
        return false;
    return name.find_first_of("\\/:*?\"<>|") == std::string::npos;
}

bool isWithinFolder(const std::string &key, const std::string &folder) {
    if (folder.empty())
        return true;
    return key.compare(0, folder.size(), folder) == 0;
}

std::string applyRenamePattern(const std::string &key,
                               const std::string &pattern, int number) {
    std::string suffix = pattern.empty() ? std::string("({n})") : pattern;
    const std::string token = "{n}";
    const auto at = suffix.find(token);
    if (at != std::string::npos)
        suffix.replace(at, token.size(), std::to_string(number));
    else
        suffix += std::to_string(number);

    const std::string parent = parentPrefix(key);
    const std::string leaf = leafName(key);
    if (isFolderKey(key))
        return parent + leaf + suffix + "/";

    // Dotfiles ("/.env") have no extension.
    const auto dot = leaf.rfind('.');
    if (dot == std::string::npos || dot == 0)
        return parent + leaf + suffix;
    return parent + leaf.substr(0, dot) + suffix + leaf.substr(dot);
}

} // namespace owlxfer

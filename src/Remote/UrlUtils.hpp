#ifndef URL_UTILS_HPP_
#define URL_UTILS_HPP_

#include <string>

namespace remote {

// 以 base 的 scheme/host/port 为准解析 pathAndQuery（以 '/' 开头时替换整个路径）。
// base 非法时抛出 RemoteAccessError(InvalidUrl)。
std::string joinUrl(const std::string& base, const std::string& pathAndQuery);

// 百分号编码，用于 query 中不可信的部分
std::string urlEncode(const std::string& text);

// 校验并规范化用户输入的地址
std::string normalizeUrl(const std::string& url);

}  // namespace remote

#endif  // URL_UTILS_HPP_

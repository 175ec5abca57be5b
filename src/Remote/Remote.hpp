#ifndef REMOTE_HPP_
#define REMOTE_HPP_

#include <stdexcept>
#include <string>

#include "Database.hpp"
#include "HttpClient.hpp"

namespace remote {

class RemoteSetupError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// 校验用户给出的 Drop 地址（GET <url>/api/v1 须返回 {"appName": "Drop"}），
// 通过后写入数据库。返回规范化后的地址。
std::string useRemote(storage::Database& db, HttpClient& client,
                      const std::string& url);

}  // namespace remote

#endif  // REMOTE_HPP_

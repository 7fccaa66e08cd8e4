#ifndef HTTP_CLIENT_HPP_
#define HTTP_CLIENT_HPP_

#include <map>
#include <string>

#include "result.hpp"

namespace zvukdl {

struct HttpRequest {
  std::string url;
  std::map<std::string, std::string> headers;
  std::string cookie;  // "name=value; name2=value2"
  bool post = false;
  std::string body;
};

struct HttpResponse {
  long status = 0;
  std::map<std::string, std::string> headers;
  std::string body;

  bool ok() const { return status >= 200 && status < 300; }
};

/**
 * @brief HTTP 传输层接口；传输失败返回 NetworkError，非 2xx 仍作为响应返回
 */
class HttpClient {
 public:
  virtual ~HttpClient() = default;

  virtual utils::Result<HttpResponse> Perform(const HttpRequest& request) = 0;

  // 把响应体流式写入 path，返回 HTTP 状态码
  virtual utils::Result<long> Download(const HttpRequest& request,
                                       const std::string& path) = 0;
};

// curl_global_init / curl_global_cleanup，必须在启动任何工作线程前构造
class CurlGlobal {
 public:
  CurlGlobal();
  ~CurlGlobal();

  CurlGlobal(const CurlGlobal&) = delete;
  CurlGlobal& operator=(const CurlGlobal&) = delete;
};

struct CurlOptions {
  long connectTimeoutSec = 15;
  long timeoutSec = 120;       // 元数据请求总超时
  long lowSpeedLimit = 1024;   // 下载低于此速率（字节/秒）
  long lowSpeedTimeSec = 60;   // 持续这么久即视为失败
  bool verifyPeer = true;
};

class CurlHttpClient : public HttpClient {
 public:
  explicit CurlHttpClient(const CurlOptions& options = CurlOptions());

  utils::Result<HttpResponse> Perform(const HttpRequest& request) override;
  utils::Result<long> Download(const HttpRequest& request,
                               const std::string& path) override;

 private:
  CurlOptions options_;
};

}  // namespace zvukdl

#endif  // HTTP_CLIENT_HPP_

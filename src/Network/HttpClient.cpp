#include "HttpClient.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <memory>
#include <stdexcept>

#include "logger.hpp"

namespace zvukdl {

using utils::Error;
using utils::ErrorCode;
using utils::Result;

namespace {

struct CurlDeleter {
  void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};
struct SlistDeleter {
  void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};
using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

// 写入回调：内存
size_t write_string(void* ptr, size_t size, size_t nmemb, void* userdata) {
  std::string* out = static_cast<std::string*>(userdata);
  out->append(static_cast<char*>(ptr), size * nmemb);
  return size * nmemb;
}

// 写入回调：文件
size_t write_file(void* ptr, size_t size, size_t nmemb, void* stream) {
  std::ofstream* ofs = static_cast<std::ofstream*>(stream);
  ofs->write(static_cast<char*>(ptr), size * nmemb);
  return ofs->good() ? size * nmemb : 0;
}

std::string trim(const std::string& s) {
  size_t b = 0, e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

// 响应头回调，名称统一转小写；重定向时只保留最后一次响应的头
size_t write_header(char* buffer, size_t size, size_t nitems, void* userdata) {
  auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
  std::string line(buffer, size * nitems);
  if (line.compare(0, 5, "HTTP/") == 0) {
    headers->clear();
    return size * nitems;
  }
  auto pos = line.find(':');
  if (pos != std::string::npos) {
    std::string name = trim(line.substr(0, pos));
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    (*headers)[name] = trim(line.substr(pos + 1));
  }
  return size * nitems;
}

HeaderList buildHeaders(const HttpRequest& request) {
  curl_slist* list = nullptr;
  for (const auto& kv : request.headers) {
    std::string line = kv.first + ": " + kv.second;
    curl_slist* next = curl_slist_append(list, line.c_str());
    if (!next) {
      curl_slist_free_all(list);
      return HeaderList();
    }
    list = next;
  }
  return HeaderList(list);
}

void applyCommon(CURL* curl, const HttpRequest& request,
                 const CurlOptions& options, curl_slist* headers) {
  curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, options.connectTimeoutSec);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, options.verifyPeer ? 1L : 0L);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, options.verifyPeer ? 2L : 0L);
  curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
  if (headers) {
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
  }
  if (!request.cookie.empty()) {
    curl_easy_setopt(curl, CURLOPT_COOKIE, request.cookie.c_str());
  }
  if (request.post) {
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE,
                     static_cast<long>(request.body.size()));
  }
}

}  // namespace

CurlGlobal::CurlGlobal() {
  if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
    throw std::runtime_error("curl_global_init failed");
  }
}

CurlGlobal::~CurlGlobal() { curl_global_cleanup(); }

CurlHttpClient::CurlHttpClient(const CurlOptions& options)
    : options_(options) {}

Result<HttpResponse> CurlHttpClient::Perform(const HttpRequest& request) {
  CurlHandle curl(curl_easy_init());
  if (!curl) {
    return Error(ErrorCode::NetworkError, "curl_easy_init failed");
  }
  HeaderList headers = buildHeaders(request);
  HttpResponse response;

  applyCommon(curl.get(), request, options_, headers.get());
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, options_.timeoutSec);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_string);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, write_header);
  curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &response.headers);

  CURLcode res = curl_easy_perform(curl.get());
  if (res != CURLE_OK) {
    return Error(ErrorCode::NetworkError, curl_easy_strerror(res));
  }
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
  LOG(DEBUG) << (request.post ? "POST " : "GET ") << request.url << " -> "
             << response.status << " (" << response.body.size() << " bytes)";
  return response;
}

Result<long> CurlHttpClient::Download(const HttpRequest& request,
                                      const std::string& path) {
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  if (!ofs) {
    return Error(ErrorCode::WriteError, "failed to open " + path);
  }
  CurlHandle curl(curl_easy_init());
  if (!curl) {
    return Error(ErrorCode::NetworkError, "curl_easy_init failed");
  }
  HeaderList headers = buildHeaders(request);

  applyCommon(curl.get(), request, options_, headers.get());
  // 大文件不设总超时，只限制持续低速
  curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, options_.lowSpeedLimit);
  curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME,
                   options_.lowSpeedTimeSec);
  curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_file);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ofs);

  CURLcode res = curl_easy_perform(curl.get());
  long status = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
  ofs.close();
  if (res == CURLE_HTTP_RETURNED_ERROR) {
    return status;
  }
  if (res == CURLE_WRITE_ERROR || !ofs) {
    return Error(ErrorCode::WriteError, "failed writing " + path);
  }
  if (res != CURLE_OK) {
    return Error(ErrorCode::NetworkError, curl_easy_strerror(res));
  }
  return status;
}

}  // namespace zvukdl

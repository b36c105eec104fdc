#include "csv_stream/s3_storage.hpp"
#include "csv_stream/log.hpp"
#include <httplib.h>

namespace cs {

struct S3Storage::Impl {
  Config cfg;
  NowFn now;
  std::string scheme = "https";
  std::string host;
  bool path_style = false;

  Impl(Config c, NowFn n) : cfg(std::move(c)), now(std::move(n)) {
    if (!now) now = [] { return std::time(nullptr); };

    std::string ep = cfg.endpoint;
    if (ep.empty()) {
      host = cfg.bucket + ".s3." + cfg.creds.region + ".amazonaws.com";
      return;
    }
    auto sep = ep.find("://");
    if (sep != std::string::npos) {
      scheme = ep.substr(0, sep);
      ep = ep.substr(sep + 3);
    }
    while (!ep.empty() && ep.back() == '/') ep.pop_back();
    host = ep;
    path_style = true;
  }

  std::string uri(const std::string& key) const {
    std::string k = key;
    while (!k.empty() && k.front() == '/') k.erase(0, 1);
    if (path_style) return "/" + uri_encode(cfg.bucket, true) + "/" + uri_encode(k, false);
    return "/" + uri_encode(k, false);
  }

  httplib::Client client() const {
    httplib::Client cli(scheme + "://" + host);
    cli.set_connection_timeout(cfg.timeout_s, 0);
    cli.set_read_timeout(cfg.timeout_s, 0);
    cli.set_write_timeout(cfg.timeout_s, 0);
    return cli;
  }

  httplib::Headers signed_headers(const char* method, const std::string& uri,
                                  std::string_view payload) const {
    auto s = sign_request(cfg.creds, method, host, uri, "", payload, now());
    return httplib::Headers{
        {"Host", host},
        {"x-amz-date", s.amz_date},
        {"x-amz-content-sha256", s.content_sha256},
        {"Authorization", s.authorization},
    };
  }
};

S3Storage::S3Storage(Config cfg, NowFn now) : p_(new Impl(std::move(cfg), std::move(now))) {
  log_info("storage", concat("S3Storage bucket=", p_->cfg.bucket, " host=", p_->host,
                             (p_->path_style ? " (path-style)" : "")));
}
S3Storage::~S3Storage() { delete p_; }

std::string S3Storage::scheme() const { return p_->scheme; }
std::string S3Storage::host() const { return p_->host; }
std::string S3Storage::object_uri(const std::string& key) const { return p_->uri(key); }

std::optional<std::string> S3Storage::save(const std::string& path,
                                           std::string_view content,
                                           std::string* err) {
  const std::string uri = p_->uri(path);
  auto headers = p_->signed_headers("PUT", uri, content);
  auto cli = p_->client();
  auto res = cli.Put(uri, headers, content.data(), content.size(), "text/csv");
  if (!res) {
    if (err) *err = "S3 PUT failed: " + httplib::to_string(res.error());
    return std::nullopt;
  }
  if (res->status < 200 || res->status >= 300) {
    if (err) *err = "S3 PUT " + path + " returned HTTP " + std::to_string(res->status);
    return std::nullopt;
  }
  log_info("storage", concat("uploaded s3://", p_->cfg.bucket, "/", path));
  return path;
}

bool S3Storage::exists(const std::string& path) {
  const std::string uri = p_->uri(path);
  auto headers = p_->signed_headers("HEAD", uri, "");
  auto cli = p_->client();
  auto res = cli.Head(uri, headers);
  if (!res) {
    log_warn("storage", concat("S3 HEAD ", path, " failed: ", httplib::to_string(res.error())));
    return false;
  }
  return res->status == 200;
}

std::string S3Storage::url_for(const std::string& path) {
  if (p_->cfg.endpoint.find("digitaloceanspaces") != std::string::npos) {
    return "https://" + p_->cfg.bucket + "." + p_->cfg.creds.region +
           ".digitaloceanspaces.com/" + uri_encode(path, false);
  }
  if (p_->cfg.creds.access_key.empty() || p_->cfg.creds.secret_key.empty()) {
    return "s3://" + p_->cfg.bucket + "/" + path;
  }
  return presign_url(p_->cfg.creds, p_->scheme, p_->host, p_->uri(path),
                     p_->cfg.presign_expiry_s, p_->now());
}

}

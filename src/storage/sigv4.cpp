#include "csv_stream/sigv4.hpp"
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>

namespace cs {

std::string hex_encode(std::string_view bytes) {
  static const char* hex = "0123456789abcdef";
  std::string out;
  out.reserve(bytes.size() * 2);
  for (unsigned char c : bytes) {
    out.push_back(hex[c >> 4]);
    out.push_back(hex[c & 0xF]);
  }
  return out;
}

std::string sha256_hex(std::string_view data) {
  unsigned char md[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), md);
  return hex_encode(std::string_view(reinterpret_cast<const char*>(md), sizeof(md)));
}

std::string hmac_sha256(std::string_view key, std::string_view data) {
  unsigned char md[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
       reinterpret_cast<const unsigned char*>(data.data()), data.size(), md, &len);
  return std::string(reinterpret_cast<const char*>(md), len);
}

std::string uri_encode(std::string_view s, bool encode_slash) {
  static const char* hex = "0123456789ABCDEF";
  std::string out;
  out.reserve(s.size() * 3);
  for (unsigned char c : s) {
    const bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                            (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~';
    if (unreserved || (c == '/' && !encode_slash)) {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(hex[c >> 4]);
      out.push_back(hex[c & 0xF]);
    }
  }
  return out;
}

static std::string format_utc(std::time_t t, const char* fmt) {
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buf[32];
  const std::size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
  return std::string(buf, n);
}

std::string amz_datetime(std::time_t t) { return format_utc(t, "%Y%m%dT%H%M%SZ"); }
std::string amz_date(std::time_t t) { return format_utc(t, "%Y%m%d"); }

std::string derive_signing_key(std::string_view secret, std::string_view date,
                               std::string_view region, std::string_view service) {
  const std::string k_secret = "AWS4" + std::string(secret);
  const std::string k_date = hmac_sha256(k_secret, date);
  const std::string k_region = hmac_sha256(k_date, region);
  const std::string k_service = hmac_sha256(k_region, service);
  return hmac_sha256(k_service, "aws4_request");
}

static std::string scope_of(const AwsCredentials& c, const std::string& date) {
  return date + "/" + c.region + "/" + c.service + "/aws4_request";
}

static std::string signature_for(const AwsCredentials& c, const std::string& date,
                                 const std::string& datetime, const std::string& canonical_request) {
  const std::string string_to_sign =
      "AWS4-HMAC-SHA256\n" + datetime + "\n" + scope_of(c, date) + "\n" + sha256_hex(canonical_request);
  const std::string key = derive_signing_key(c.secret_key, date, c.region, c.service);
  return hex_encode(hmac_sha256(key, string_to_sign));
}

SignedRequest sign_request(const AwsCredentials& creds,
                           std::string_view method,
                           std::string_view host,
                           std::string_view canonical_uri,
                           std::string_view canonical_query,
                           std::string_view payload,
                           std::time_t now) {
  SignedRequest out;
  out.amz_date = amz_datetime(now);
  out.content_sha256 = sha256_hex(payload);
  const std::string date = amz_date(now);
  const std::string signed_headers = "host;x-amz-content-sha256;x-amz-date";

  std::string canonical;
  canonical.append(method).append("\n");
  canonical.append(canonical_uri).append("\n");
  canonical.append(canonical_query).append("\n");
  canonical.append("host:").append(host).append("\n");
  canonical.append("x-amz-content-sha256:").append(out.content_sha256).append("\n");
  canonical.append("x-amz-date:").append(out.amz_date).append("\n\n");
  canonical.append(signed_headers).append("\n");
  canonical.append(out.content_sha256);

  out.authorization = "AWS4-HMAC-SHA256 Credential=" + creds.access_key + "/" + scope_of(creds, date) +
                      ", SignedHeaders=" + signed_headers +
                      ", Signature=" + signature_for(creds, date, out.amz_date, canonical);
  return out;
}

std::string presign_url(const AwsCredentials& creds,
                        std::string_view scheme,
                        std::string_view host,
                        std::string_view canonical_uri,
                        std::uint32_t expires_s,
                        std::time_t now) {
  const std::string datetime = amz_datetime(now);
  const std::string date = amz_date(now);
  const std::string credential = creds.access_key + "/" + scope_of(creds, date);

  // already in lexicographic order
  std::string query;
  query.append("X-Amz-Algorithm=AWS4-HMAC-SHA256");
  query.append("&X-Amz-Credential=").append(uri_encode(credential, true));
  query.append("&X-Amz-Date=").append(datetime);
  query.append("&X-Amz-Expires=").append(std::to_string(expires_s));
  query.append("&X-Amz-SignedHeaders=host");

  std::string canonical;
  canonical.append("GET\n");
  canonical.append(canonical_uri).append("\n");
  canonical.append(query).append("\n");
  canonical.append("host:").append(host).append("\n\n");
  canonical.append("host\n");
  canonical.append("UNSIGNED-PAYLOAD");

  std::string url;
  url.append(scheme).append("://").append(host).append(canonical_uri);
  url.append("?").append(query);
  url.append("&X-Amz-Signature=").append(signature_for(creds, date, datetime, canonical));
  return url;
}

}

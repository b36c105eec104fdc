#pragma once
#include <cstdint>
#include <ctime>
#include <string>
#include <string_view>

namespace cs {

// AWS Signature Version 4, enough of it for S3 object PUT/HEAD and presigned GET.
struct AwsCredentials {
  std::string access_key;
  std::string secret_key;
  std::string region = "us-east-1";
  std::string service = "s3";
};

std::string sha256_hex(std::string_view data);
std::string hmac_sha256(std::string_view key, std::string_view data); // raw digest bytes
std::string hex_encode(std::string_view bytes);

// RFC 3986 encoding; '/' survives unless `encode_slash`.
std::string uri_encode(std::string_view s, bool encode_slash);

std::string amz_datetime(std::time_t t); // 20130524T000000Z
std::string amz_date(std::time_t t);     // 20130524

// kSigning = HMAC chain over date, region, service, "aws4_request".
std::string derive_signing_key(std::string_view secret, std::string_view date,
                               std::string_view region, std::string_view service);

struct SignedRequest {
  std::string authorization;
  std::string amz_date;
  std::string content_sha256;
};

// Header-based signing. Signed headers: host, x-amz-content-sha256, x-amz-date.
// `canonical_query` must already be encoded and sorted ("" when none).
SignedRequest sign_request(const AwsCredentials& creds,
                           std::string_view method,
                           std::string_view host,
                           std::string_view canonical_uri,
                           std::string_view canonical_query,
                           std::string_view payload,
                           std::time_t now);

// Query-string signed URL (UNSIGNED-PAYLOAD, signed header: host).
std::string presign_url(const AwsCredentials& creds,
                        std::string_view scheme,
                        std::string_view host,
                        std::string_view canonical_uri,
                        std::uint32_t expires_s,
                        std::time_t now);

}

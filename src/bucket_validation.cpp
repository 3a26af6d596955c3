// SPDX-License-Identifier: MIT

// src/bucket_validation.cpp
#include "src/bucket_validation.hpp"

#include <array>
#include <cstddef>

#include <fmt/format.h>

namespace xfer_pipe {

namespace {

constexpr std::string_view kArnPrefix = "arn:";
constexpr std::string_view kObjectLambdaMarker = ":s3-object-lambda";

bool IsAccessPointResource(std::string_view resource) {
    return resource.starts_with("accesspoint/") || resource.starts_with("accesspoint:") ||
           resource.starts_with("outpost/") || resource.starts_with("outpost:");
}

}  // namespace

std::expected<ArnParts, Error> ParseArn(std::string_view arn) {
    // Five separators; everything after the fifth belongs to the resource
    std::array<std::string_view, 6> fields;
    std::size_t start = 0;
    for (std::size_t i = 0; i < 5; ++i) {
        auto pos = arn.find(':', start);
        if (pos == std::string_view::npos) {
            return std::unexpected(Error{ErrorCode::InvalidArgument,
                fmt::format("Malformed ARN: {}", arn)});
        }
        fields[i] = arn.substr(start, pos - start);
        start = pos + 1;
    }
    fields[5] = arn.substr(start);

    if (fields[0] != "arn" || fields[1].empty() || fields[2].empty() || fields[5].empty()) {
        return std::unexpected(Error{ErrorCode::InvalidArgument,
            fmt::format("Malformed ARN: {}", arn)});
    }

    return ArnParts{
        .partition = std::string(fields[1]),
        .service = std::string(fields[2]),
        .region = std::string(fields[3]),
        .account_id = std::string(fields[4]),
        .resource = std::string(fields[5]),
    };
}

std::expected<void, Error> ValidateBucket(std::string_view bucket, std::string_view operation) {
    if (bucket.empty()) {
        return std::unexpected(Error{ErrorCode::InvalidArgument,
            fmt::format("{} requires a bucket", operation)});
    }
    if (!bucket.starts_with(kArnPrefix)) return {};

    if (bucket.find(kObjectLambdaMarker) != std::string_view::npos) {
        return std::unexpected(Error{ErrorCode::UnsupportedResource,
            fmt::format("{} does not support S3 Object Lambda resources", operation)});
    }

    auto arn = ParseArn(bucket);
    if (!arn) return std::unexpected(arn.error());

    if (arn->service != "s3" || !IsAccessPointResource(arn->resource)) {
        return std::unexpected(Error{ErrorCode::InvalidArgument,
            "An ARN was passed as a bucket parameter to an S3 operation, however it does "
            "not appear to be a valid S3 access point ARN"});
    }

    if (arn->region.empty()) {
        return std::unexpected(Error{ErrorCode::UnsupportedResource,
            fmt::format("{} does not support S3 multi-region access point ARN", operation)});
    }
    return {};
}

}  // namespace xfer_pipe

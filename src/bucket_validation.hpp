// SPDX-License-Identifier: MIT

// src/bucket_validation.hpp
#pragma once

#include <expected>
#include <string>
#include <string_view>

#include "lib/stream/error.hpp"

namespace xfer_pipe {

/// Parsed form of `arn:partition:service:region:account-id:resource`.
struct ArnParts {
    std::string partition;
    std::string service;
    std::string region;    ///< Empty for multi-region resources
    std::string account_id;
    std::string resource;  ///< May itself contain ':' and '/'
};

/// Split an ARN into its fields. Fails with InvalidArgument when the prefix
/// is not "arn" or fewer than six fields are present.
std::expected<ArnParts, Error> ParseArn(std::string_view arn);

/// Reject bucket identifiers the transfer front end cannot serve.
///
/// Plain bucket names pass. ARNs naming an S3 Object Lambda resource or a
/// multi-region access point fail with UnsupportedResource, with @p operation
/// named in the message. Other ARNs must be S3 access point ARNs.
std::expected<void, Error> ValidateBucket(std::string_view bucket, std::string_view operation);

}  // namespace xfer_pipe

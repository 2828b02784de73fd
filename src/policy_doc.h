#pragma once

#include "resource.h"

#include <optional>
#include <string>
#include <string_view>

namespace strata {

// Queue access policy letting S3 events from source_arn be delivered to queue_arn.
std::string queue_policy_document(std::string_view queue_arn, std::string_view source_arn);

// True when some Allow statement in the policy grants sqs:SendMessage on queue_arn
// to source_arn. A policy that never mentions source_arn is rejected without parsing;
// malformed documents are treated as not granting anything.
bool policy_allows_source(std::string_view policy,
                          std::string_view queue_arn,
                          std::string_view source_arn);

// True when the resource policy has a statement whose Sid equals statement_id.
bool policy_has_statement(std::string_view policy, std::string_view statement_id);

// Appends one invoke statement to a function resource policy, creating the document
// when there is none yet.
std::string policy_add_statement(std::optional<std::string> const &policy,
                                 permission_grant const &grant);

// Number of statements in a policy document (0 for malformed input).
std::size_t policy_statement_count(std::string_view policy);

bool notification_targets_queue(notification_config const &config,
                                std::string_view queue_arn);

}  // namespace strata

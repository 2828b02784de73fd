#pragma once

#include <string>
#include <string_view>

namespace strata {

// Identifiers derived from names; none of these touch the control plane.

std::string arn_bucket(std::string_view bucket);
std::string arn_function(std::string_view region,
                         std::string_view account_id,
                         std::string_view function_name);

// API Gateway -> Lambda proxy integration target.
std::string arn_lambda_integration_uri(std::string_view region,
                                       std::string_view account_id,
                                       std::string_view function_name);

// execute-api ARN scoping an invoke permission to one method and path on any stage.
std::string arn_execute_api_source(std::string_view region,
                                   std::string_view account_id,
                                   std::string_view api_id,
                                   std::string_view http_method,
                                   std::string_view path_part);

std::string permission_statement_id(std::string_view api_id,
                                    std::string_view resource_id,
                                    std::string_view http_method);

}  // namespace strata

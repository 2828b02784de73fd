#include "arn.h"

namespace strata {

std::string arn_bucket(std::string_view bucket) {
  return "arn:aws:s3:::" + std::string(bucket);
}

std::string arn_function(std::string_view region,
                         std::string_view account_id,
                         std::string_view function_name) {
  std::string out{ "arn:aws:lambda:" };
  out.append(region).append(":").append(account_id).append(":function:");
  out.append(function_name);
  return out;
}

std::string arn_lambda_integration_uri(std::string_view region,
                                       std::string_view account_id,
                                       std::string_view function_name) {
  std::string out{ "arn:aws:apigateway:" };
  out.append(region).append(":lambda:path/2015-03-31/functions/");
  out.append(arn_function(region, account_id, function_name));
  out.append("/invocations");
  return out;
}

std::string arn_execute_api_source(std::string_view region,
                                   std::string_view account_id,
                                   std::string_view api_id,
                                   std::string_view http_method,
                                   std::string_view path_part) {
  std::string out{ "arn:aws:execute-api:" };
  out.append(region).append(":").append(account_id).append(":").append(api_id);
  out.append("/*/").append(http_method).append("/").append(path_part);
  return out;
}

std::string permission_statement_id(std::string_view api_id,
                                    std::string_view resource_id,
                                    std::string_view http_method) {
  std::string out{ "apigw-invoke-" };
  out.append(api_id).append("-").append(resource_id).append("-").append(http_method);
  return out;
}

}  // namespace strata

#include "arn.h"

#include "doctest/doctest.h"

TEST_CASE("arn_bucket") {
  CHECK(strata::arn_bucket("image-service-root") == "arn:aws:s3:::image-service-root");
}

TEST_CASE("arn_function") {
  CHECK(strata::arn_function("us-east-1", "000000000000", "upload_images") ==
        "arn:aws:lambda:us-east-1:000000000000:function:upload_images");
}

TEST_CASE("arn_lambda_integration_uri") {
  CHECK(strata::arn_lambda_integration_uri("eu-west-1", "123456789012", "list_images") ==
        "arn:aws:apigateway:eu-west-1:lambda:path/2015-03-31/functions/"
        "arn:aws:lambda:eu-west-1:123456789012:function:list_images/invocations");
}

TEST_CASE("arn_execute_api_source scopes to method and path on any stage") {
  CHECK(strata::arn_execute_api_source("us-east-1",
                                       "000000000000",
                                       "a1b2c3",
                                       "POST",
                                       "uploadImages") ==
        "arn:aws:execute-api:us-east-1:000000000000:a1b2c3/*/POST/uploadImages");
}

TEST_CASE("permission_statement_id is stable per api, resource and method") {
  auto const sid{ strata::permission_statement_id("a1b2c3", "r9", "DELETE") };
  CHECK(sid == "apigw-invoke-a1b2c3-r9-DELETE");
  CHECK(sid == strata::permission_statement_id("a1b2c3", "r9", "DELETE"));
  CHECK(sid != strata::permission_statement_id("a1b2c3", "r9", "GET"));
}

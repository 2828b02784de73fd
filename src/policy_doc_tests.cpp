#include "policy_doc.h"

#include "doctest/doctest.h"

#include <string>

namespace {

constexpr char const *kQueueArn{ "arn:aws:sqs:us-east-1:000000000000:image-events-queue" };
constexpr char const *kBucketArn{ "arn:aws:s3:::image-service-root" };

strata::permission_grant make_grant(std::string sid) {
  return strata::permission_grant{
    .function_name = "upload_images",
    .statement_id = std::move(sid),
    .source_arn = "arn:aws:execute-api:us-east-1:000000000000:a1/*/POST/uploadImages",
  };
}

}  // namespace

TEST_CASE("queue_policy_document grants the bucket send access") {
  auto const doc{ strata::queue_policy_document(kQueueArn, kBucketArn) };
  CHECK(doc.find("\"Version\":\"2012-10-17\"") != std::string::npos);
  CHECK(doc.find("\"Action\":\"SQS:SendMessage\"") != std::string::npos);
  CHECK(strata::policy_statement_count(doc) == 1);
  CHECK(strata::policy_allows_source(doc, kQueueArn, kBucketArn));
}

TEST_CASE("policy_allows_source") {
  SUBCASE("different source is not allowed") {
    auto const doc{ strata::queue_policy_document(kQueueArn, "arn:aws:s3:::other") };
    CHECK_FALSE(strata::policy_allows_source(doc, kQueueArn, kBucketArn));
  }

  SUBCASE("source mentioned outside a condition is not enough") {
    std::string const doc{ R"({"Statement":[{"Sid":"arn:aws:s3:::image-service-root",)"
                           R"("Effect":"Allow","Action":"sqs:SendMessage"}]})" };
    CHECK_FALSE(strata::policy_allows_source(doc, kQueueArn, kBucketArn));
  }

  SUBCASE("deny statement does not count") {
    std::string const doc{
      R"({"Statement":{"Effect":"Deny","Action":"sqs:*",)"
      R"("Condition":{"ArnLike":{"aws:SourceArn":"arn:aws:s3:::image-service-root"}}}})"
    };
    CHECK_FALSE(strata::policy_allows_source(doc, kQueueArn, kBucketArn));
  }

  SUBCASE("single statement object, wildcard action, list-valued condition") {
    std::string const doc{
      R"({"Statement":{"Effect":"Allow","Action":["sqs:*"],"Resource":"*",)"
      R"("Condition":{"StringEquals":{"AWS:SOURCEARN":["x","arn:aws:s3:::image-service-root"]}}}})"
    };
    CHECK(strata::policy_allows_source(doc, kQueueArn, kBucketArn));
  }

  SUBCASE("resource naming another queue") {
    std::string const doc{
      R"({"Statement":[{"Effect":"Allow","Action":"sqs:SendMessage",)"
      R"("Resource":"arn:aws:sqs:us-east-1:000000000000:other",)"
      R"("Condition":{"ArnEquals":{"aws:SourceArn":"arn:aws:s3:::image-service-root"}}}]})"
    };
    CHECK_FALSE(strata::policy_allows_source(doc, kQueueArn, kBucketArn));
  }

  SUBCASE("malformed document") {
    CHECK_FALSE(strata::policy_allows_source("{ arn:aws:s3:::image-service-root",
                                             kQueueArn,
                                             kBucketArn));
  }

  SUBCASE("empty policy") {
    CHECK_FALSE(strata::policy_allows_source("", kQueueArn, kBucketArn));
  }
}

TEST_CASE("policy_add_statement builds and extends a resource policy") {
  auto const first{ strata::policy_add_statement(std::nullopt, make_grant("sid-one")) };
  CHECK(strata::policy_statement_count(first) == 1);
  CHECK(strata::policy_has_statement(first, "sid-one"));
  CHECK_FALSE(strata::policy_has_statement(first, "sid-two"));
  CHECK(first.find("\"Service\":\"apigateway.amazonaws.com\"") != std::string::npos);
  CHECK(first.find("\"Id\":\"default\"") != std::string::npos);

  auto const second{ strata::policy_add_statement(first, make_grant("sid-two")) };
  CHECK(strata::policy_statement_count(second) == 2);
  CHECK(strata::policy_has_statement(second, "sid-one"));
  CHECK(strata::policy_has_statement(second, "sid-two"));
}

TEST_CASE("policy_has_statement matches Sid, not substrings") {
  auto const doc{ strata::policy_add_statement(std::nullopt, make_grant("sid-one-long")) };
  CHECK_FALSE(strata::policy_has_statement(doc, "sid-one"));
  CHECK_FALSE(strata::policy_has_statement(doc, ""));
  CHECK_FALSE(strata::policy_has_statement("not json sid-one-long", "sid-one-long"));
}

TEST_CASE("policy_statement_count of malformed input is zero") {
  CHECK(strata::policy_statement_count("") == 0);
  CHECK(strata::policy_statement_count("[1,2") == 0);
  CHECK(strata::policy_statement_count(R"({"Version":"2012-10-17"})") == 0);
}

TEST_CASE("notification_targets_queue") {
  strata::notification_config config;
  CHECK_FALSE(strata::notification_targets_queue(config, kQueueArn));

  config.queue_configurations.push_back({ .queue_arn = "arn:aws:sqs:us-east-1:0:other",
                                          .events = { "s3:ObjectCreated:*" } });
  CHECK_FALSE(strata::notification_targets_queue(config, kQueueArn));

  config.queue_configurations.push_back(
      { .queue_arn = kQueueArn, .events = { "s3:ObjectCreated:*" } });
  CHECK(strata::notification_targets_queue(config, kQueueArn));
}

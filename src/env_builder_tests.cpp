#include "env_builder.h"

#include "errors.h"

#include "doctest/doctest.h"

#include <string>

namespace {

strata::env_builder make_builder(std::map<std::string, strata::env_map> overrides = {}) {
  return strata::env_builder{
    { { "BUCKET_NAME", "${ROOT_BUCKET}" },
      { "TABLE_NAME", "${TABLE_NAME}" },
      { "LOCALSTACK_ENDPOINT", "http://localstack:4566" },
      { "AWS_REGION", "${REGION}" } },
    { { "ROOT_BUCKET", "image-service-root" },
      { "TABLE_NAME", "ImagesMetadata" },
      { "REGION", "us-east-1" } },
    std::move(overrides),
  };
}

}  // namespace

TEST_CASE("env_builder expand") {
  auto const builder{ make_builder() };

  SUBCASE("plain value passes through") {
    CHECK(builder.expand("http://localstack:4566") == "http://localstack:4566");
    CHECK(builder.expand("") == "");
  }

  SUBCASE("references are substituted") {
    CHECK(builder.expand("${ROOT_BUCKET}") == "image-service-root");
    CHECK(builder.expand("s3://${ROOT_BUCKET}/${REGION}/x") ==
          "s3://image-service-root/us-east-1/x");
  }

  SUBCASE("lone dollar is literal") { CHECK(builder.expand("$5 and $") == "$5 and $"); }

  SUBCASE("unknown reference") {
    CHECK_THROWS_AS(builder.expand("${NOPE}"), strata::configuration_error);
  }

  SUBCASE("empty reference") {
    CHECK_THROWS_AS(builder.expand("${}"), strata::configuration_error);
  }

  SUBCASE("unterminated reference") {
    CHECK_THROWS_AS(builder.expand("${ROOT_BUCKET"), strata::configuration_error);
  }
}

TEST_CASE("env_builder build merges overrides over base") {
  auto const builder{ make_builder({
      { "upload_images", { { "PRESIGN_EXP", "900" }, { "UPLOAD_LIMIT", "10485760" } } },
      { "list_images", { { "PAGE_SIZE", "10" }, { "AWS_REGION", "eu-west-1" } } },
  }) };

  SUBCASE("override-only keys are added, base keys pass through") {
    auto const env{ builder.build("upload_images") };
    CHECK(env.size() == 6);
    CHECK(env.at("PRESIGN_EXP") == "900");
    CHECK(env.at("UPLOAD_LIMIT") == "10485760");
    CHECK(env.at("BUCKET_NAME") == "image-service-root");
    CHECK(env.at("TABLE_NAME") == "ImagesMetadata");
    CHECK(env.at("LOCALSTACK_ENDPOINT") == "http://localstack:4566");
    CHECK(env.at("AWS_REGION") == "us-east-1");
  }

  SUBCASE("override value replaces base value once") {
    auto const env{ builder.build("list_images") };
    CHECK(env.size() == 5);
    CHECK(env.at("AWS_REGION") == "eu-west-1");
    CHECK(env.count("AWS_REGION") == 1);

    auto const doc{ strata::env_builder::document(env) };
    auto const first{ doc.find("\"AWS_REGION\"") };
    REQUIRE(first != std::string::npos);
    CHECK(doc.find("\"AWS_REGION\"", first + 1) == std::string::npos);
  }

  SUBCASE("function without overrides gets the base") {
    auto const env{ builder.build("s3_listener") };
    CHECK(env.size() == 4);
    CHECK(env.at("BUCKET_NAME") == "image-service-root");
  }

  SUBCASE("overrides do not leak between functions") {
    CHECK(builder.build("upload_images").count("PAGE_SIZE") == 0);
  }
}

TEST_CASE("env_builder build rejects bad overrides") {
  SUBCASE("unknown reference in override") {
    auto const builder{ make_builder({ { "f", { { "X", "${MISSING}" } } } }) };
    CHECK_THROWS_AS(builder.build("f"), strata::configuration_error);
  }

  SUBCASE("invalid key") {
    auto const builder{ make_builder({ { "f", { { "1BAD", "x" } } } }) };
    CHECK_THROWS_AS(builder.build("f"), strata::configuration_error);
  }
}

TEST_CASE("env_builder document") {
  CHECK(strata::env_builder::document({}) == R"({"Variables":{}})");
  CHECK(strata::env_builder::document({ { "A", "1" }, { "B", "two words" } }) ==
        R"({"Variables":{"A":"1","B":"two words"}})");
}

TEST_CASE("env_builder validate") {
  CHECK_NOTHROW(strata::env_builder::validate({ { "PAGE_SIZE", "10" }, { "_X1", "" } }));
  CHECK_NOTHROW(strata::env_builder::validate({ { "QUOTE", "say \"hi\"\n" } }));
  CHECK_THROWS_AS(strata::env_builder::validate({ { "", "x" } }), strata::configuration_error);
  CHECK_THROWS_AS(strata::env_builder::validate({ { "HAS-DASH", "x" } }),
                  strata::configuration_error);
  CHECK_THROWS_AS(strata::env_builder::validate({ { "HAS SPACE", "x" } }),
                  strata::configuration_error);
}

#include "deploy_config.h"

#include "errors.h"
#include "platform.h"

#include "doctest/doctest.h"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>

namespace {

// Restores the control-plane environment variables on scope exit.
struct env_guard {
  static constexpr char const *kNames[]{ "AWS_REGION", "STRATA_ENDPOINT", "AWS_ENDPOINT_URL" };
  std::optional<std::string> saved[3];

  env_guard() {
    for (int i{ 0 }; i < 3; ++i) {
      saved[i] = strata::platform::get_env_var(kNames[i]);
      strata::platform::unset_env_var(kNames[i]);
    }
  }

  ~env_guard() {
    for (int i{ 0 }; i < 3; ++i) {
      if (saved[i]) {
        strata::platform::set_env_var(kNames[i], saved[i]->c_str());
      } else {
        strata::platform::unset_env_var(kNames[i]);
      }
    }
  }
};

strata::deploy_config apply(std::string const &script) {
  auto cfg{ strata::deploy_config::defaults() };
  strata::deploy_config_apply_lua(cfg, script, "=test");
  return cfg;
}

std::filesystem::path make_temp_dir() {
  static std::atomic<int> counter{ 0 };
  auto const dir{ std::filesystem::temp_directory_path() /
                  ("strata-config-test-" + std::to_string(counter.fetch_add(1))) };
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

}  // namespace

TEST_CASE("deploy_config::defaults describes the image service") {
  auto const cfg{ strata::deploy_config::defaults() };

  CHECK(cfg.region == "us-east-1");
  CHECK_FALSE(cfg.endpoint.has_value());
  CHECK(cfg.bucket == "image-service-root");
  CHECK(cfg.table.name == "ImagesMetadata");
  CHECK(cfg.table.hash_key == "user_id");
  CHECK(cfg.table.range_key == "image_id");
  CHECK(cfg.table.billing_mode == "PAY_PER_REQUEST");
  CHECK(cfg.api.name == "image-service-api");
  CHECK(cfg.api.description == "LocalStack Image Service API");
  CHECK(cfg.api.endpoint_type == "EDGE");
  CHECK(cfg.stage == "local");
  CHECK(cfg.queue == "image-events-queue");
  CHECK(cfg.queue_consumer == "s3_listener");
  CHECK(cfg.common_env.at("BUCKET_NAME") == "${ROOT_BUCKET}");

  REQUIRE(cfg.functions.size() == 4);
  auto const *upload{ cfg.find_function("upload_images") };
  REQUIRE(upload);
  REQUIRE(upload->route.has_value());
  CHECK(upload->route->path == "uploadImages");
  CHECK(upload->route->http_method == "POST");
  CHECK(upload->env.at("PRESIGN_EXP") == "900");
  CHECK(upload->env.at("UPLOAD_LIMIT") == "10485760");
  CHECK(upload->handler == "lambdas.upload_images.handler.handler");
  CHECK(upload->runtime == "python3.9");
  CHECK(upload->timeout_seconds == 15);

  CHECK(cfg.find_function("list_images")->route->http_method == "GET");
  CHECK(cfg.find_function("delete_images")->route->http_method == "DELETE");
  CHECK_FALSE(cfg.find_function("s3_listener")->route.has_value());
  CHECK(cfg.find_function("nope") == nullptr);

  CHECK_NOTHROW(strata::deploy_config_validate(cfg));
}

TEST_CASE("deploy_config::variables") {
  auto cfg{ strata::deploy_config::defaults() };
  auto vars{ cfg.variables() };
  CHECK(vars.at("ROOT_BUCKET") == "image-service-root");
  CHECK(vars.at("TABLE_NAME") == "ImagesMetadata");
  CHECK(vars.at("REGION") == "us-east-1");
  CHECK(vars.count("ENDPOINT") == 0);

  cfg.endpoint = "http://localhost:4566";
  vars = cfg.variables();
  CHECK(vars.at("ENDPOINT") == "http://localhost:4566");
}

TEST_CASE("parse_route") {
  SUBCASE("path and method") {
    auto const r{ strata::parse_route("uploadImages:POST") };
    CHECK(r.path == "uploadImages");
    CHECK(r.http_method == "POST");
  }

  SUBCASE("method is upper-cased and whitespace trimmed") {
    auto const r{ strata::parse_route(" listImages : get ") };
    CHECK(r.path == "listImages");
    CHECK(r.http_method == "GET");
  }

  SUBCASE("invalid routes") {
    CHECK_THROWS_AS(strata::parse_route("uploadImages"), strata::configuration_error);
    CHECK_THROWS_AS(strata::parse_route(":POST"), strata::configuration_error);
    CHECK_THROWS_AS(strata::parse_route("a/b:POST"), strata::configuration_error);
    CHECK_THROWS_AS(strata::parse_route("upload:FETCH"), strata::configuration_error);
    CHECK_THROWS_AS(strata::parse_route("upload:"), strata::configuration_error);
  }
}

TEST_CASE("deploy_config_apply_lua overlays globals") {
  auto const cfg{ apply(R"(
    REGION = "eu-west-1"
    ENDPOINT = "http://localhost:4566"
    BUCKET = "photos"
    STAGE = "dev"
    COMMON_ENV = { BUCKET_NAME = "${ROOT_BUCKET}" }
    QUEUE_CONSUMER = "listener"
    FUNCTIONS = {
      { name = "upload", route = "upload:post", env = { LIMIT = 5 }, timeout = 30 },
      { name = "listener", handler = "app.listener", runtime = "python3.12" },
    }
  )") };

  CHECK(cfg.region == "eu-west-1");
  CHECK(cfg.endpoint == "http://localhost:4566");
  CHECK(cfg.bucket == "photos");
  CHECK(cfg.stage == "dev");
  CHECK(cfg.table.name == "ImagesMetadata");
  CHECK(cfg.common_env.size() == 1);

  REQUIRE(cfg.functions.size() == 2);
  auto const &upload{ cfg.functions[0] };
  CHECK(upload.name == "upload");
  REQUIRE(upload.route.has_value());
  CHECK(upload.route->http_method == "POST");
  CHECK(upload.env.at("LIMIT") == "5");
  CHECK(upload.timeout_seconds == 30);
  CHECK(upload.handler == "lambdas.upload.handler.handler");

  auto const &listener{ cfg.functions[1] };
  CHECK_FALSE(listener.route.has_value());
  CHECK(listener.handler == "app.listener");
  CHECK(listener.runtime == "python3.12");
  CHECK(listener.timeout_seconds == 15);

  CHECK_NOTHROW(strata::deploy_config_validate(cfg));
}

TEST_CASE("deploy_config_apply_lua empty ENDPOINT clears the override") {
  auto cfg{ strata::deploy_config::defaults() };
  cfg.endpoint = "http://localhost:4566";
  strata::deploy_config_apply_lua(cfg, "ENDPOINT = ''", "=test");
  CHECK_FALSE(cfg.endpoint.has_value());
}

TEST_CASE("deploy_config_apply_lua errors") {
  SUBCASE("syntax error") {
    CHECK_THROWS_AS(apply("BUCKET = "), strata::configuration_error);
  }

  SUBCASE("runtime error") {
    CHECK_THROWS_AS(apply("error('boom')"), strata::configuration_error);
  }

  SUBCASE("wrong type") {
    CHECK_THROWS_AS(apply("BUCKET = 42"), strata::configuration_error);
  }

  SUBCASE("function entry is not a table") {
    CHECK_THROWS_AS(apply("FUNCTIONS = { 'upload' }"), strata::configuration_error);
  }

  SUBCASE("function without name") {
    CHECK_THROWS_AS(apply("FUNCTIONS = { { route = 'a:GET' } }"),
                    strata::configuration_error);
  }

  SUBCASE("bad route") {
    CHECK_THROWS_AS(apply("FUNCTIONS = { { name = 'a', route = 'a' } }"),
                    strata::configuration_error);
  }
}

TEST_CASE("deploy_config_validate") {
  auto cfg{ strata::deploy_config::defaults() };

  SUBCASE("duplicate function names") {
    cfg.functions.push_back(cfg.functions[0]);
    CHECK_THROWS_AS(strata::deploy_config_validate(cfg), strata::configuration_error);
  }

  SUBCASE("duplicate routes") {
    cfg.functions[1].route = cfg.functions[0].route;
    CHECK_THROWS_AS(strata::deploy_config_validate(cfg), strata::configuration_error);
  }

  SUBCASE("undeclared queue consumer") {
    cfg.queue_consumer = "ghost";
    CHECK_THROWS_AS(strata::deploy_config_validate(cfg), strata::configuration_error);
  }

  SUBCASE("no functions") {
    cfg.functions.clear();
    CHECK_THROWS_AS(strata::deploy_config_validate(cfg), strata::configuration_error);
  }

  SUBCASE("blank bucket") {
    cfg.bucket = "  ";
    CHECK_THROWS_AS(strata::deploy_config_validate(cfg), strata::configuration_error);
  }

  SUBCASE("non-positive timeout") {
    cfg.functions[2].timeout_seconds = 0;
    CHECK_THROWS_AS(strata::deploy_config_validate(cfg), strata::configuration_error);
  }
}

TEST_CASE("deploy_config_apply_env") {
  env_guard guard;
  auto cfg{ strata::deploy_config::defaults() };

  SUBCASE("unset environment keeps defaults") {
    strata::deploy_config_apply_env(cfg);
    CHECK(cfg.region == "us-east-1");
    CHECK_FALSE(cfg.endpoint.has_value());
  }

  SUBCASE("region and generic endpoint") {
    strata::platform::set_env_var("AWS_REGION", "ap-south-1");
    strata::platform::set_env_var("AWS_ENDPOINT_URL", "http://aws:4566");
    strata::deploy_config_apply_env(cfg);
    CHECK(cfg.region == "ap-south-1");
    CHECK(cfg.endpoint == "http://aws:4566");
  }

  SUBCASE("strata endpoint wins") {
    strata::platform::set_env_var("STRATA_ENDPOINT", "http://localstack:4566");
    strata::platform::set_env_var("AWS_ENDPOINT_URL", "http://aws:4566");
    strata::deploy_config_apply_env(cfg);
    CHECK(cfg.endpoint == "http://localstack:4566");
  }

  SUBCASE("empty region is ignored") {
    strata::platform::set_env_var("AWS_REGION", "");
    strata::deploy_config_apply_env(cfg);
    CHECK(cfg.region == "us-east-1");
  }
}

TEST_CASE("deploy_config_load") {
  env_guard guard;

  SUBCASE("without a file") {
    auto const cfg{ strata::deploy_config_load(std::nullopt) };
    CHECK(cfg.bucket == "image-service-root");
    CHECK(cfg.source_root == std::filesystem::path{ "src" });
  }

  SUBCASE("file overrides the environment, source root is file-relative") {
    strata::platform::set_env_var("AWS_REGION", "ap-south-1");
    auto const dir{ make_temp_dir() };
    auto const path{ dir / "strata.lua" };
    {
      std::ofstream out{ path };
      out << "REGION = 'eu-central-1'\nSOURCE_ROOT = 'app'\n";
    }

    auto const cfg{ strata::deploy_config_load(path) };
    std::filesystem::remove_all(dir);

    CHECK(cfg.region == "eu-central-1");
    CHECK(cfg.source_root == dir / "app");
  }

  SUBCASE("missing file") {
    CHECK_THROWS_AS(strata::deploy_config_load(std::filesystem::path{ "/nonexistent/x.lua" }),
                    strata::configuration_error);
  }

  SUBCASE("invalid result") {
    auto const dir{ make_temp_dir() };
    auto const path{ dir / "strata.lua" };
    {
      std::ofstream out{ path };
      out << "QUEUE_CONSUMER = 'nobody'\n";
    }
    CHECK_THROWS_AS(strata::deploy_config_load(path), strata::configuration_error);
    std::filesystem::remove_all(dir);
  }
}

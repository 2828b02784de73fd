#include "aws_control_plane.h"

#include "errors.h"
#include "tui.h"

#include "aws/apigateway/model/CreateDeploymentRequest.h"
#include "aws/apigateway/model/CreateResourceRequest.h"
#include "aws/apigateway/model/CreateRestApiRequest.h"
#include "aws/apigateway/model/EndpointConfiguration.h"
#include "aws/apigateway/model/EndpointType.h"
#include "aws/apigateway/model/GetIntegrationRequest.h"
#include "aws/apigateway/model/GetMethodRequest.h"
#include "aws/apigateway/model/GetResourcesRequest.h"
#include "aws/apigateway/model/GetRestApisRequest.h"
#include "aws/apigateway/model/IntegrationType.h"
#include "aws/apigateway/model/PutIntegrationRequest.h"
#include "aws/apigateway/model/PutMethodRequest.h"
#include "aws/core/auth/AWSAuthSigner.h"
#include "aws/core/http/HttpResponse.h"
#include "aws/core/utils/Array.h"
#include "aws/dynamodb/model/AttributeDefinition.h"
#include "aws/dynamodb/model/BillingMode.h"
#include "aws/dynamodb/model/CreateTableRequest.h"
#include "aws/dynamodb/model/DescribeTableRequest.h"
#include "aws/dynamodb/model/KeySchemaElement.h"
#include "aws/dynamodb/model/TableStatus.h"
#include "aws/lambda/model/AddPermissionRequest.h"
#include "aws/lambda/model/CreateEventSourceMappingRequest.h"
#include "aws/lambda/model/CreateFunctionRequest.h"
#include "aws/lambda/model/Environment.h"
#include "aws/lambda/model/EventSourcePosition.h"
#include "aws/lambda/model/FunctionCode.h"
#include "aws/lambda/model/GetFunctionConfigurationRequest.h"
#include "aws/lambda/model/GetFunctionRequest.h"
#include "aws/lambda/model/GetPolicyRequest.h"
#include "aws/lambda/model/LastUpdateStatus.h"
#include "aws/lambda/model/ListEventSourceMappingsRequest.h"
#include "aws/lambda/model/Runtime.h"
#include "aws/lambda/model/State.h"
#include "aws/lambda/model/UpdateFunctionCodeRequest.h"
#include "aws/lambda/model/UpdateFunctionConfigurationRequest.h"
#include "aws/s3/model/BucketLocationConstraint.h"
#include "aws/s3/model/CreateBucketConfiguration.h"
#include "aws/s3/model/CreateBucketRequest.h"
#include "aws/s3/model/Event.h"
#include "aws/s3/model/GetBucketNotificationConfigurationRequest.h"
#include "aws/s3/model/HeadBucketRequest.h"
#include "aws/s3/model/LambdaFunctionConfiguration.h"
#include "aws/s3/model/NotificationConfiguration.h"
#include "aws/s3/model/PutBucketNotificationConfigurationRequest.h"
#include "aws/s3/model/QueueConfiguration.h"
#include "aws/s3/model/TopicConfiguration.h"
#include "aws/sqs/model/CreateQueueRequest.h"
#include "aws/sqs/model/GetQueueAttributesRequest.h"
#include "aws/sqs/model/GetQueueUrlRequest.h"
#include "aws/sqs/model/QueueAttributeName.h"
#include "aws/sqs/model/SetQueueAttributesRequest.h"

#include <string_view>
#include <thread>

namespace strata {
namespace {

namespace apigw = Aws::APIGateway::Model;
namespace ddb = Aws::DynamoDB::Model;
namespace lambda = Aws::Lambda::Model;
namespace s3 = Aws::S3::Model;
namespace sqs = Aws::SQS::Model;

constexpr int kPageLimit{ 500 };
constexpr int kSettleAttempts{ 30 };
constexpr std::chrono::seconds kSettleInterval{ 1 };

template <typename Error>
std::string error_code(Error const &error) {
  auto code{ std_str(error.GetExceptionName()) };
  if (code.empty()) { code = std::to_string(static_cast<int>(error.GetResponseCode())); }
  return code;
}

template <typename Error>
[[noreturn]] void raise(char const *operation, Error const &error) {
  throw remote_error(operation, error_code(error), std_str(error.GetMessage()));
}

template <typename Error>
[[noreturn]] void raise_conflict(char const *operation, Error const &error) {
  throw creation_conflict(operation, error_code(error), std_str(error.GetMessage()));
}

template <typename Error>
bool is_http_not_found(Error const &error) {
  return error.GetResponseCode() == Aws::Http::HttpResponseCode::NOT_FOUND;
}

template <typename Error>
bool name_contains(Error const &error, std::string_view needle) {
  return std_str(error.GetExceptionName()).find(needle) != std::string::npos;
}

template <typename Error>
bool is_missing_queue(Error const &error) {
  return error.GetErrorType() == Aws::SQS::SQSErrors::QUEUE_DOES_NOT_EXIST ||
         name_contains(error, "NonExistentQueue") ||
         name_contains(error, "QueueDoesNotExist");
}

Aws::Map<Aws::String, Aws::String> to_aws_map(env_map const &env) {
  Aws::Map<Aws::String, Aws::String> out;
  for (auto const &[k, v] : env) { out.emplace(aws_str(k), aws_str(v)); }
  return out;
}

Aws::Utils::ByteBuffer to_byte_buffer(std::vector<unsigned char> const &bytes) {
  return Aws::Utils::ByteBuffer{ bytes.data(), bytes.size() };
}

lambda::Environment to_environment(env_map const &env) {
  lambda::Environment out;
  out.SetVariables(to_aws_map(env));
  return out;
}

}  // namespace

aws_control_plane::aws_control_plane(aws_client_options const &options)
    : region_{ options.region },
      config_{ aws_client_config(options) },
      // Path-style addressing; LocalStack does not serve virtual-hosted buckets.
      s3_{ config_,
           Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
           !options.endpoint.has_value() },
      dynamodb_{ config_ },
      apigateway_{ config_ },
      lambda_{ config_ },
      sqs_{ config_ } {
  tui::debug("AWS control plane: region=%s endpoint=%s",
             region_.c_str(),
             options.endpoint ? options.endpoint->c_str() : "(default)");
}

bool aws_control_plane::bucket_exists(std::string const &bucket) {
  s3::HeadBucketRequest request;
  request.SetBucket(aws_str(bucket));

  auto const outcome{ s3_.HeadBucket(request) };
  if (outcome.IsSuccess()) { return true; }

  auto const &error{ outcome.GetError() };
  if (is_http_not_found(error) || error.GetErrorType() == Aws::S3::S3Errors::NO_SUCH_BUCKET) {
    return false;
  }
  raise("HeadBucket", error);
}

bool aws_control_plane::table_exists(std::string const &table) {
  auto const outcome{ dynamodb_.DescribeTable(
      ddb::DescribeTableRequest().WithTableName(aws_str(table))) };
  if (outcome.IsSuccess()) { return true; }

  auto const &error{ outcome.GetError() };
  if (error.GetErrorType() == Aws::DynamoDB::DynamoDBErrors::RESOURCE_NOT_FOUND) {
    return false;
  }
  raise("DescribeTable", error);
}

std::vector<api_summary> aws_control_plane::list_apis() {
  std::vector<api_summary> out;
  Aws::String position;

  do {
    apigw::GetRestApisRequest request;
    request.SetLimit(kPageLimit);
    if (!position.empty()) { request.SetPosition(position); }

    auto outcome{ apigateway_.GetRestApis(request) };
    if (!outcome.IsSuccess()) { raise("GetRestApis", outcome.GetError()); }

    auto const &result{ outcome.GetResult() };
    for (auto const &api : result.GetItems()) {
      out.push_back(api_summary{ .id = std_str(api.GetId()),
                                 .name = std_str(api.GetName()),
                                 .created_epoch_ms = api.GetCreatedDate().Millis() });
    }
    position = result.GetPosition();
  } while (!position.empty());

  return out;
}

std::vector<gateway_resource> aws_control_plane::get_resources(std::string const &api_id) {
  std::vector<gateway_resource> out;
  Aws::String position;

  do {
    apigw::GetResourcesRequest request;
    request.SetRestApiId(aws_str(api_id));
    request.SetLimit(kPageLimit);
    if (!position.empty()) { request.SetPosition(position); }

    auto outcome{ apigateway_.GetResources(request) };
    if (!outcome.IsSuccess()) { raise("GetResources", outcome.GetError()); }

    auto const &result{ outcome.GetResult() };
    for (auto const &r : result.GetItems()) {
      gateway_resource resource{ .id = std_str(r.GetId()), .path = std_str(r.GetPath()) };
      if (!r.GetParentId().empty()) { resource.parent_id = std_str(r.GetParentId()); }
      out.push_back(std::move(resource));
    }
    position = result.GetPosition();
  } while (!position.empty());

  return out;
}

bool aws_control_plane::method_exists(std::string const &api_id,
                                      std::string const &resource_id,
                                      std::string const &http_method) {
  apigw::GetMethodRequest request;
  request.SetRestApiId(aws_str(api_id));
  request.SetResourceId(aws_str(resource_id));
  request.SetHttpMethod(aws_str(http_method));

  auto const outcome{ apigateway_.GetMethod(request) };
  if (outcome.IsSuccess()) { return true; }

  auto const &error{ outcome.GetError() };
  if (error.GetErrorType() == Aws::APIGateway::APIGatewayErrors::NOT_FOUND ||
      is_http_not_found(error)) {
    return false;
  }
  raise("GetMethod", error);
}

bool aws_control_plane::integration_exists(std::string const &api_id,
                                           std::string const &resource_id,
                                           std::string const &http_method) {
  apigw::GetIntegrationRequest request;
  request.SetRestApiId(aws_str(api_id));
  request.SetResourceId(aws_str(resource_id));
  request.SetHttpMethod(aws_str(http_method));

  auto const outcome{ apigateway_.GetIntegration(request) };
  if (outcome.IsSuccess()) { return true; }

  auto const &error{ outcome.GetError() };
  if (error.GetErrorType() == Aws::APIGateway::APIGatewayErrors::NOT_FOUND ||
      is_http_not_found(error)) {
    return false;
  }
  raise("GetIntegration", error);
}

bool aws_control_plane::function_exists(std::string const &function_name) {
  lambda::GetFunctionRequest request;
  request.SetFunctionName(aws_str(function_name));

  auto const outcome{ lambda_.GetFunction(request) };
  if (outcome.IsSuccess()) { return true; }

  auto const &error{ outcome.GetError() };
  if (error.GetErrorType() == Aws::Lambda::LambdaErrors::RESOURCE_NOT_FOUND ||
      is_http_not_found(error)) {
    return false;
  }
  raise("GetFunction", error);
}

std::optional<std::string> aws_control_plane::get_function_policy(
    std::string const &function_name) {
  lambda::GetPolicyRequest request;
  request.SetFunctionName(aws_str(function_name));

  auto const outcome{ lambda_.GetPolicy(request) };
  if (outcome.IsSuccess()) { return std_str(outcome.GetResult().GetPolicy()); }

  // A function without a resource policy answers ResourceNotFound too.
  auto const &error{ outcome.GetError() };
  if (error.GetErrorType() == Aws::Lambda::LambdaErrors::RESOURCE_NOT_FOUND ||
      is_http_not_found(error)) {
    return std::nullopt;
  }
  raise("GetPolicy", error);
}

std::optional<std::string> aws_control_plane::get_queue_url(std::string const &queue_name) {
  sqs::GetQueueUrlRequest request;
  request.SetQueueName(aws_str(queue_name));

  auto const outcome{ sqs_.GetQueueUrl(request) };
  if (outcome.IsSuccess()) { return std_str(outcome.GetResult().GetQueueUrl()); }

  auto const &error{ outcome.GetError() };
  if (is_missing_queue(error)) { return std::nullopt; }
  raise("GetQueueUrl", error);
}

std::string aws_control_plane::get_queue_arn(std::string const &queue_url) {
  sqs::GetQueueAttributesRequest request;
  request.SetQueueUrl(aws_str(queue_url));
  request.AddAttributeNames(sqs::QueueAttributeName::QueueArn);

  auto const outcome{ sqs_.GetQueueAttributes(request) };
  if (!outcome.IsSuccess()) { raise("GetQueueAttributes", outcome.GetError()); }

  auto const &attributes{ outcome.GetResult().GetAttributes() };
  auto const it{ attributes.find(sqs::QueueAttributeName::QueueArn) };
  if (it == attributes.end() || it->second.empty()) {
    throw remote_error("GetQueueAttributes", "MissingQueueArn", "no QueueArn for " + queue_url);
  }
  return std_str(it->second);
}

std::optional<std::string> aws_control_plane::get_queue_policy(std::string const &queue_url) {
  sqs::GetQueueAttributesRequest request;
  request.SetQueueUrl(aws_str(queue_url));
  request.AddAttributeNames(sqs::QueueAttributeName::Policy);

  auto const outcome{ sqs_.GetQueueAttributes(request) };
  if (!outcome.IsSuccess()) { raise("GetQueueAttributes", outcome.GetError()); }

  auto const &attributes{ outcome.GetResult().GetAttributes() };
  auto const it{ attributes.find(sqs::QueueAttributeName::Policy) };
  if (it == attributes.end()) { return std::nullopt; }
  return std_str(it->second);
}

notification_config aws_control_plane::get_bucket_notification(std::string const &bucket) {
  s3::GetBucketNotificationConfigurationRequest request;
  request.SetBucket(aws_str(bucket));

  auto const outcome{ s3_.GetBucketNotificationConfiguration(request) };
  if (!outcome.IsSuccess()) {
    raise("GetBucketNotificationConfiguration", outcome.GetError());
  }

  notification_config out;
  for (auto const &q : outcome.GetResult().GetQueueConfigurations()) {
    notification_target target{ .queue_arn = std_str(q.GetQueueArn()) };
    for (auto const event : q.GetEvents()) {
      target.events.push_back(std_str(s3::EventMapper::GetNameForEvent(event)));
    }
    out.queue_configurations.push_back(std::move(target));
  }
  for (auto const &f : outcome.GetResult().GetLambdaFunctionConfigurations()) {
    out.other_targets.push_back("lambda:" + std_str(f.GetLambdaFunctionArn()));
  }
  for (auto const &t : outcome.GetResult().GetTopicConfigurations()) {
    out.other_targets.push_back("topic:" + std_str(t.GetTopicArn()));
  }
  return out;
}

std::vector<event_source_mapping> aws_control_plane::list_event_source_mappings(
    std::string const &function_name,
    std::string const &source_arn) {
  std::vector<event_source_mapping> out;
  Aws::String marker;

  do {
    lambda::ListEventSourceMappingsRequest request;
    request.SetFunctionName(aws_str(function_name));
    request.SetEventSourceArn(aws_str(source_arn));
    if (!marker.empty()) { request.SetMarker(marker); }

    auto outcome{ lambda_.ListEventSourceMappings(request) };
    if (!outcome.IsSuccess()) {
      auto const &error{ outcome.GetError() };
      if (error.GetErrorType() == Aws::Lambda::LambdaErrors::RESOURCE_NOT_FOUND) {
        return out;
      }
      raise("ListEventSourceMappings", error);
    }

    auto const &result{ outcome.GetResult() };
    for (auto const &m : result.GetEventSourceMappings()) {
      out.push_back(event_source_mapping{ .uuid = std_str(m.GetUUID()),
                                          .function_name = function_name,
                                          .source_arn = std_str(m.GetEventSourceArn()) });
    }
    marker = result.GetNextMarker();
  } while (!marker.empty());

  return out;
}

void aws_control_plane::create_bucket(std::string const &bucket) {
  s3::CreateBucketRequest request;
  request.SetBucket(aws_str(bucket));
  // us-east-1 rejects an explicit location constraint.
  if (region_ != "us-east-1") {
    s3::CreateBucketConfiguration location;
    location.SetLocationConstraint(
        s3::BucketLocationConstraintMapper::GetBucketLocationConstraintForName(
            aws_str(region_)));
    request.SetCreateBucketConfiguration(location);
  }

  auto const outcome{ s3_.CreateBucket(request) };
  if (outcome.IsSuccess()) { return; }

  auto const &error{ outcome.GetError() };
  if (error.GetErrorType() == Aws::S3::S3Errors::BUCKET_ALREADY_OWNED_BY_YOU ||
      error.GetErrorType() == Aws::S3::S3Errors::BUCKET_ALREADY_EXISTS) {
    raise_conflict("CreateBucket", error);
  }
  raise("CreateBucket", error);
}

void aws_control_plane::create_table(table_spec const &spec) {
  using SAT = ddb::ScalarAttributeType;

  ddb::CreateTableRequest request;
  request.SetTableName(aws_str(spec.name));
  request.SetAttributeDefinitions(
      { ddb::AttributeDefinition()
            .WithAttributeName(aws_str(spec.hash_key))
            .WithAttributeType(SAT::S),
        ddb::AttributeDefinition()
            .WithAttributeName(aws_str(spec.range_key))
            .WithAttributeType(SAT::S) });
  request.SetKeySchema(
      { ddb::KeySchemaElement()
            .WithAttributeName(aws_str(spec.hash_key))
            .WithKeyType(ddb::KeyType::HASH),
        ddb::KeySchemaElement()
            .WithAttributeName(aws_str(spec.range_key))
            .WithKeyType(ddb::KeyType::RANGE) });
  request.SetBillingMode(
      ddb::BillingModeMapper::GetBillingModeForName(aws_str(spec.billing_mode)));

  auto const outcome{ dynamodb_.CreateTable(request) };
  if (!outcome.IsSuccess()) {
    auto const &error{ outcome.GetError() };
    if (error.GetErrorType() == Aws::DynamoDB::DynamoDBErrors::RESOURCE_IN_USE) {
      raise_conflict("CreateTable", error);
    }
    raise("CreateTable", error);
  }

  await_table_active(spec.name);
}

void aws_control_plane::await_table_active(std::string const &table) {
  for (int attempt{ 1 }; attempt <= kSettleAttempts; ++attempt) {
    auto const outcome{ dynamodb_.DescribeTable(
        ddb::DescribeTableRequest().WithTableName(aws_str(table))) };
    if (!outcome.IsSuccess()) { raise("DescribeTable", outcome.GetError()); }

    if (outcome.GetResult().GetTable().GetTableStatus() == ddb::TableStatus::ACTIVE) {
      return;
    }
    tui::debug("Waiting for table %s to become ACTIVE (%d/%d)",
               table.c_str(),
               attempt,
               kSettleAttempts);
    std::this_thread::sleep_for(kSettleInterval);
  }
  throw remote_error("DescribeTable", "TableNotActive", table + " did not become ACTIVE");
}

std::string aws_control_plane::create_api(api_spec const &spec) {
  apigw::EndpointConfiguration endpoint;
  endpoint.AddTypes(
      apigw::EndpointTypeMapper::GetEndpointTypeForName(aws_str(spec.endpoint_type)));

  apigw::CreateRestApiRequest request;
  request.SetName(aws_str(spec.name));
  request.SetDescription(aws_str(spec.description));
  request.SetEndpointConfiguration(endpoint);

  auto const outcome{ apigateway_.CreateRestApi(request) };
  if (!outcome.IsSuccess()) { raise("CreateRestApi", outcome.GetError()); }
  return std_str(outcome.GetResult().GetId());
}

std::string aws_control_plane::create_resource(std::string const &api_id,
                                               std::string const &parent_id,
                                               std::string const &path_part) {
  apigw::CreateResourceRequest request;
  request.SetRestApiId(aws_str(api_id));
  request.SetParentId(aws_str(parent_id));
  request.SetPathPart(aws_str(path_part));

  auto const outcome{ apigateway_.CreateResource(request) };
  if (!outcome.IsSuccess()) {
    auto const &error{ outcome.GetError() };
    if (error.GetErrorType() == Aws::APIGateway::APIGatewayErrors::CONFLICT) {
      raise_conflict("CreateResource", error);
    }
    raise("CreateResource", error);
  }
  return std_str(outcome.GetResult().GetId());
}

void aws_control_plane::put_method(method_spec const &spec) {
  apigw::PutMethodRequest request;
  request.SetRestApiId(aws_str(spec.api_id));
  request.SetResourceId(aws_str(spec.resource_id));
  request.SetHttpMethod(aws_str(spec.http_method));
  request.SetAuthorizationType(aws_str(spec.authorization));

  auto const outcome{ apigateway_.PutMethod(request) };
  if (!outcome.IsSuccess()) {
    auto const &error{ outcome.GetError() };
    if (error.GetErrorType() == Aws::APIGateway::APIGatewayErrors::CONFLICT) {
      raise_conflict("PutMethod", error);
    }
    raise("PutMethod", error);
  }
}

void aws_control_plane::put_integration(integration_spec const &spec) {
  apigw::PutIntegrationRequest request;
  request.SetRestApiId(aws_str(spec.api_id));
  request.SetResourceId(aws_str(spec.resource_id));
  request.SetHttpMethod(aws_str(spec.http_method));
  request.SetType(apigw::IntegrationTypeMapper::GetIntegrationTypeForName(aws_str(spec.type)));
  request.SetIntegrationHttpMethod(aws_str(spec.integration_http_method));
  request.SetUri(aws_str(spec.uri));

  auto const outcome{ apigateway_.PutIntegration(request) };
  if (!outcome.IsSuccess()) { raise("PutIntegration", outcome.GetError()); }
}

std::string aws_control_plane::create_deployment(std::string const &api_id,
                                                 std::string const &stage) {
  apigw::CreateDeploymentRequest request;
  request.SetRestApiId(aws_str(api_id));
  request.SetStageName(aws_str(stage));

  auto const outcome{ apigateway_.CreateDeployment(request) };
  if (!outcome.IsSuccess()) { raise("CreateDeployment", outcome.GetError()); }
  return std_str(outcome.GetResult().GetId());
}

void aws_control_plane::create_function(function_spec const &spec) {
  lambda::FunctionCode code;
  code.SetZipFile(to_byte_buffer(spec.code));

  lambda::CreateFunctionRequest request;
  request.SetFunctionName(aws_str(spec.name));
  request.SetRuntime(lambda::RuntimeMapper::GetRuntimeForName(aws_str(spec.runtime)));
  request.SetRole(aws_str(spec.role_arn));
  request.SetHandler(aws_str(spec.handler));
  request.SetTimeout(spec.timeout_seconds);
  request.SetEnvironment(to_environment(spec.environment));
  request.SetCode(code);

  auto const outcome{ lambda_.CreateFunction(request) };
  if (!outcome.IsSuccess()) {
    auto const &error{ outcome.GetError() };
    if (error.GetErrorType() == Aws::Lambda::LambdaErrors::RESOURCE_CONFLICT) {
      raise_conflict("CreateFunction", error);
    }
    raise("CreateFunction", error);
  }

  await_function_settled(spec.name);
}

void aws_control_plane::update_function_code(std::string const &function_name,
                                             std::vector<unsigned char> const &zip) {
  lambda::UpdateFunctionCodeRequest request;
  request.SetFunctionName(aws_str(function_name));
  request.SetZipFile(to_byte_buffer(zip));

  auto const outcome{ lambda_.UpdateFunctionCode(request) };
  if (!outcome.IsSuccess()) { raise("UpdateFunctionCode", outcome.GetError()); }

  await_function_settled(function_name);
}

void aws_control_plane::update_function_configuration(function_spec const &spec) {
  lambda::UpdateFunctionConfigurationRequest request;
  request.SetFunctionName(aws_str(spec.name));
  request.SetRuntime(lambda::RuntimeMapper::GetRuntimeForName(aws_str(spec.runtime)));
  request.SetRole(aws_str(spec.role_arn));
  request.SetHandler(aws_str(spec.handler));
  request.SetTimeout(spec.timeout_seconds);
  request.SetEnvironment(to_environment(spec.environment));

  auto const outcome{ lambda_.UpdateFunctionConfiguration(request) };
  if (!outcome.IsSuccess()) { raise("UpdateFunctionConfiguration", outcome.GetError()); }

  await_function_settled(spec.name);
}

void aws_control_plane::await_function_settled(std::string const &function_name) {
  for (int attempt{ 1 }; attempt <= kSettleAttempts; ++attempt) {
    lambda::GetFunctionConfigurationRequest request;
    request.SetFunctionName(aws_str(function_name));

    auto const outcome{ lambda_.GetFunctionConfiguration(request) };
    if (!outcome.IsSuccess()) { raise("GetFunctionConfiguration", outcome.GetError()); }

    auto const &result{ outcome.GetResult() };
    if (result.GetState() == lambda::State::Failed) {
      throw remote_error("GetFunctionConfiguration",
                         "FunctionFailed",
                         function_name + ": " + std_str(result.GetStateReason()));
    }
    if (result.GetState() != lambda::State::Pending &&
        result.GetLastUpdateStatus() != lambda::LastUpdateStatus::InProgress) {
      return;
    }

    tui::debug("Waiting for function %s to settle (%d/%d)",
               function_name.c_str(),
               attempt,
               kSettleAttempts);
    std::this_thread::sleep_for(kSettleInterval);
  }
  throw remote_error("GetFunctionConfiguration",
                     "FunctionNotSettled",
                     function_name + " is still being updated");
}

void aws_control_plane::add_permission(permission_grant const &grant) {
  lambda::AddPermissionRequest request;
  request.SetFunctionName(aws_str(grant.function_name));
  request.SetStatementId(aws_str(grant.statement_id));
  request.SetAction(aws_str(grant.action));
  request.SetPrincipal(aws_str(grant.principal));
  request.SetSourceArn(aws_str(grant.source_arn));

  auto const outcome{ lambda_.AddPermission(request) };
  if (!outcome.IsSuccess()) {
    auto const &error{ outcome.GetError() };
    if (error.GetErrorType() == Aws::Lambda::LambdaErrors::RESOURCE_CONFLICT) {
      raise_conflict("AddPermission", error);
    }
    raise("AddPermission", error);
  }
}

std::string aws_control_plane::create_queue(std::string const &queue_name) {
  sqs::CreateQueueRequest request;
  request.SetQueueName(aws_str(queue_name));

  auto const outcome{ sqs_.CreateQueue(request) };
  if (!outcome.IsSuccess()) {
    auto const &error{ outcome.GetError() };
    if (name_contains(error, "QueueAlreadyExists") || name_contains(error, "QueueNameExists")) {
      raise_conflict("CreateQueue", error);
    }
    raise("CreateQueue", error);
  }
  return std_str(outcome.GetResult().GetQueueUrl());
}

void aws_control_plane::set_queue_policy(std::string const &queue_url,
                                         std::string const &policy) {
  sqs::SetQueueAttributesRequest request;
  request.SetQueueUrl(aws_str(queue_url));
  request.AddAttributes(sqs::QueueAttributeName::Policy, aws_str(policy));

  auto const outcome{ sqs_.SetQueueAttributes(request) };
  if (!outcome.IsSuccess()) { raise("SetQueueAttributes", outcome.GetError()); }
}

void aws_control_plane::put_bucket_notification(std::string const &bucket,
                                                notification_config const &config) {
  s3::NotificationConfiguration notification;
  for (auto const &target : config.queue_configurations) {
    s3::QueueConfiguration queue;
    queue.SetQueueArn(aws_str(target.queue_arn));
    for (auto const &event : target.events) {
      queue.AddEvents(s3::EventMapper::GetEventForName(aws_str(event)));
    }
    notification.AddQueueConfigurations(queue);
  }

  s3::PutBucketNotificationConfigurationRequest request;
  request.SetBucket(aws_str(bucket));
  request.SetNotificationConfiguration(notification);

  auto const outcome{ s3_.PutBucketNotificationConfiguration(request) };
  if (!outcome.IsSuccess()) {
    raise("PutBucketNotificationConfiguration", outcome.GetError());
  }
}

std::string aws_control_plane::create_event_source_mapping(
    event_source_mapping_spec const &spec) {
  lambda::CreateEventSourceMappingRequest request;
  request.SetFunctionName(aws_str(spec.function_name));
  request.SetEventSourceArn(aws_str(spec.source_arn));
  request.SetBatchSize(spec.batch_size);
  request.SetStartingPosition(lambda::EventSourcePositionMapper::GetEventSourcePositionForName(
      aws_str(spec.starting_position)));

  auto const outcome{ lambda_.CreateEventSourceMapping(request) };
  if (!outcome.IsSuccess()) {
    auto const &error{ outcome.GetError() };
    if (error.GetErrorType() == Aws::Lambda::LambdaErrors::RESOURCE_CONFLICT) {
      raise_conflict("CreateEventSourceMapping", error);
    }
    raise("CreateEventSourceMapping", error);
  }
  return std_str(outcome.GetResult().GetUUID());
}

}  // namespace strata

#pragma once

#include "aws_util.h"
#include "control_plane.h"

#include "aws/apigateway/APIGatewayClient.h"
#include "aws/dynamodb/DynamoDBClient.h"
#include "aws/lambda/LambdaClient.h"
#include "aws/s3/S3Client.h"
#include "aws/sqs/SQSClient.h"

#include <chrono>
#include <string>

namespace strata {

// Control plane backed by the AWS SDK (real AWS, or LocalStack through an endpoint
// override). Service "not found" errors become absence; already-exists errors become
// creation_conflict; everything else is a remote_error.
class aws_control_plane : public control_plane {
 public:
  explicit aws_control_plane(aws_client_options const &options);

  bool bucket_exists(std::string const &bucket) override;
  bool table_exists(std::string const &table) override;
  std::vector<api_summary> list_apis() override;
  std::vector<gateway_resource> get_resources(std::string const &api_id) override;
  bool method_exists(std::string const &api_id,
                     std::string const &resource_id,
                     std::string const &http_method) override;
  bool integration_exists(std::string const &api_id,
                          std::string const &resource_id,
                          std::string const &http_method) override;
  bool function_exists(std::string const &function_name) override;
  std::optional<std::string> get_function_policy(std::string const &function_name) override;
  std::optional<std::string> get_queue_url(std::string const &queue_name) override;
  std::string get_queue_arn(std::string const &queue_url) override;
  std::optional<std::string> get_queue_policy(std::string const &queue_url) override;
  notification_config get_bucket_notification(std::string const &bucket) override;
  std::vector<event_source_mapping> list_event_source_mappings(
      std::string const &function_name,
      std::string const &source_arn) override;

  void create_bucket(std::string const &bucket) override;
  // Returns once the table is ACTIVE.
  void create_table(table_spec const &spec) override;
  std::string create_api(api_spec const &spec) override;
  std::string create_resource(std::string const &api_id,
                              std::string const &parent_id,
                              std::string const &path_part) override;
  void put_method(method_spec const &spec) override;
  void put_integration(integration_spec const &spec) override;
  std::string create_deployment(std::string const &api_id,
                                std::string const &stage) override;
  void create_function(function_spec const &spec) override;
  void update_function_code(std::string const &function_name,
                            std::vector<unsigned char> const &zip) override;
  void update_function_configuration(function_spec const &spec) override;
  void add_permission(permission_grant const &grant) override;
  std::string create_queue(std::string const &queue_name) override;
  void set_queue_policy(std::string const &queue_url, std::string const &policy) override;
  void put_bucket_notification(std::string const &bucket,
                               notification_config const &config) override;
  std::string create_event_source_mapping(event_source_mapping_spec const &spec) override;

 private:
  void await_table_active(std::string const &table);
  // Lambda rejects changes while a create or update is still being applied.
  void await_function_settled(std::string const &function_name);

  std::string region_;
  Aws::Client::ClientConfiguration config_;
  Aws::S3::S3Client s3_;
  Aws::DynamoDB::DynamoDBClient dynamodb_;
  Aws::APIGateway::APIGatewayClient apigateway_;
  Aws::Lambda::LambdaClient lambda_;
  Aws::SQS::SQSClient sqs_;
};

}  // namespace strata

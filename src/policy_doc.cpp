#include "policy_doc.h"

#include "aws_util.h"
#include "util.h"

#include "aws/core/utils/Array.h"
#include "aws/core/utils/json/JsonSerializer.h"

#include <string>
#include <vector>

namespace strata {

namespace {

using Aws::Utils::Json::JsonValue;
using Aws::Utils::Json::JsonView;

constexpr char const *kPolicyVersion{ "2012-10-17" };

// Policy grammar allows most fields as either a single string or a list of strings.
std::vector<std::string> string_or_list(JsonView const &parent, char const *key) {
  std::vector<std::string> out;
  if (!parent.ValueExists(key)) { return out; }

  JsonView const value{ parent.GetObject(key) };
  if (value.IsString()) {
    out.push_back(std_str(value.AsString()));
  } else if (value.IsListType()) {
    auto const items{ value.AsArray() };
    for (size_t i{ 0 }; i < items.GetLength(); ++i) {
      if (items[i].IsString()) { out.push_back(std_str(items[i].AsString())); }
    }
  }
  return out;
}

std::vector<JsonView> statements_of(JsonView const &doc) {
  std::vector<JsonView> out;
  if (!doc.ValueExists("Statement")) { return out; }

  JsonView const statement{ doc.GetObject("Statement") };
  if (statement.IsObject()) {
    out.push_back(statement);
  } else if (statement.IsListType()) {
    auto const items{ statement.AsArray() };
    for (size_t i{ 0 }; i < items.GetLength(); ++i) {
      if (items[i].IsObject()) { out.push_back(items[i]); }
    }
  }
  return out;
}

bool action_allows_send(std::vector<std::string> const &actions) {
  for (auto const &action : actions) {
    if (action == "*" || util_iequals(action, "sqs:*") ||
        util_iequals(action, "sqs:SendMessage")) {
      return true;
    }
  }
  return false;
}

bool resource_matches(JsonView const &statement, std::string_view queue_arn) {
  if (!statement.ValueExists("Resource")) { return true; }
  for (auto const &resource : string_or_list(statement, "Resource")) {
    if (resource == "*" || resource == queue_arn) { return true; }
  }
  return false;
}

// Any condition operator (ArnEquals, ArnLike, StringEquals, ...) keyed on
// aws:SourceArn that names the source.
bool condition_names_source(JsonView const &statement, std::string_view source_arn) {
  if (!statement.ValueExists("Condition")) { return false; }

  JsonView const condition{ statement.GetObject("Condition") };
  if (!condition.IsObject()) { return false; }

  for (auto const &[op, clauses] : condition.GetAllObjects()) {
    if (!clauses.IsObject()) { continue; }
    for (auto const &[key, value] : clauses.GetAllObjects()) {
      if (!util_iequals(std_str(key), "aws:SourceArn")) { continue; }
      if (value.IsString() && std_str(value.AsString()) == source_arn) { return true; }
      if (value.IsListType()) {
        auto const items{ value.AsArray() };
        for (size_t i{ 0 }; i < items.GetLength(); ++i) {
          if (items[i].IsString() && std_str(items[i].AsString()) == source_arn) {
            return true;
          }
        }
      }
    }
  }
  return false;
}

}  // namespace

std::string queue_policy_document(std::string_view queue_arn, std::string_view source_arn) {
  JsonValue source_condition;
  source_condition.WithString("aws:SourceArn", aws_str(source_arn));

  JsonValue condition;
  condition.WithObject("ArnEquals", std::move(source_condition));

  JsonValue statement;
  statement.WithString("Sid", "AllowS3SendMessage")
      .WithString("Effect", "Allow")
      .WithString("Principal", "*")
      .WithString("Action", "SQS:SendMessage")
      .WithString("Resource", aws_str(queue_arn))
      .WithObject("Condition", std::move(condition));

  Aws::Utils::Array<JsonValue> statements(1);
  statements[0] = std::move(statement);

  JsonValue doc;
  doc.WithString("Version", kPolicyVersion).WithArray("Statement", std::move(statements));
  return std_str(doc.View().WriteCompact());
}

bool policy_allows_source(std::string_view policy,
                          std::string_view queue_arn,
                          std::string_view source_arn) {
  if (source_arn.empty() || policy.find(source_arn) == std::string_view::npos) {
    return false;
  }

  JsonValue const doc{ aws_str(policy) };
  if (!doc.WasParseSuccessful()) { return false; }

  for (auto const &statement : statements_of(doc.View())) {
    if (!statement.ValueExists("Effect") ||
        std_str(statement.GetString("Effect")) != "Allow") {
      continue;
    }
    if (!action_allows_send(string_or_list(statement, "Action"))) { continue; }
    if (!resource_matches(statement, queue_arn)) { continue; }
    if (condition_names_source(statement, source_arn)) { return true; }
  }
  return false;
}

bool policy_has_statement(std::string_view policy, std::string_view statement_id) {
  if (statement_id.empty() || policy.find(statement_id) == std::string_view::npos) {
    return false;
  }

  JsonValue const doc{ aws_str(policy) };
  if (!doc.WasParseSuccessful()) { return false; }

  for (auto const &statement : statements_of(doc.View())) {
    if (statement.ValueExists("Sid") &&
        std_str(statement.GetString("Sid")) == statement_id) {
      return true;
    }
  }
  return false;
}

std::string policy_add_statement(std::optional<std::string> const &policy,
                                 permission_grant const &grant) {
  std::vector<JsonValue> existing;
  std::string id{ "default" };

  if (policy) {
    JsonValue const doc{ aws_str(*policy) };
    if (doc.WasParseSuccessful()) {
      if (doc.View().ValueExists("Id")) { id = std_str(doc.View().GetString("Id")); }
      for (auto const &statement : statements_of(doc.View())) {
        existing.emplace_back(statement.Materialize());
      }
    }
  }

  JsonValue principal;
  principal.WithString("Service", aws_str(grant.principal));

  JsonValue source;
  source.WithString("AWS:SourceArn", aws_str(grant.source_arn));
  JsonValue condition;
  condition.WithObject("ArnLike", std::move(source));

  JsonValue statement;
  statement.WithString("Sid", aws_str(grant.statement_id))
      .WithString("Effect", "Allow")
      .WithObject("Principal", std::move(principal))
      .WithString("Action", aws_str(grant.action))
      .WithString("Resource", aws_str(grant.function_name))
      .WithObject("Condition", std::move(condition));
  existing.push_back(std::move(statement));

  Aws::Utils::Array<JsonValue> statements(existing.size());
  for (size_t i{ 0 }; i < existing.size(); ++i) { statements[i] = std::move(existing[i]); }

  JsonValue doc;
  doc.WithString("Version", kPolicyVersion)
      .WithString("Id", aws_str(id))
      .WithArray("Statement", std::move(statements));
  return std_str(doc.View().WriteCompact());
}

std::size_t policy_statement_count(std::string_view policy) {
  JsonValue const doc{ aws_str(policy) };
  if (!doc.WasParseSuccessful()) { return 0; }
  return statements_of(doc.View()).size();
}

bool notification_targets_queue(notification_config const &config,
                                std::string_view queue_arn) {
  for (auto const &target : config.queue_configurations) {
    if (target.queue_arn == queue_arn) { return true; }
  }
  return false;
}

}  // namespace strata

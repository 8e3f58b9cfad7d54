#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "readlater/api/credentials.hpp"
#include "readlater/api/payloads.hpp"
#include "readlater/api/response.hpp"
#include "readlater/core/action_batch.hpp"
#include "readlater/util/http_client.hpp"

namespace readlater::api {

/**
 * @brief Entry point for the retrieve, add and modify endpoints
 *
 * Each call assembles the payload, performs exactly one POST through the
 * transport and classifies the outcome. Nothing is retried.
 */
class Client {
 public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  static constexpr const char* kRetrievePath = "/v3/get";
  static constexpr const char* kAddPath = "/v3/add";
  static constexpr const char* kSendPath = "/v3/send";

  Client(Credentials credentials, std::shared_ptr<util::HttpTransport> transport);
  Client(std::string consumer_key, std::string access_token,
         std::shared_ptr<util::HttpTransport> transport);

  const Credentials& credentials() const noexcept { return credentials_; }

  // Source of batch timestamps, the system clock by default
  void setClock(Clock clock);

  /**
   * @brief Fetch saved items
   * @param options Retrieve parameters, sent verbatim
   */
  ApiResult<RetrieveResult> retrieve(const nlohmann::json& options = nlohmann::json::object());

  // Same as retrieve() but throws ApiException on failure
  RetrieveResult retrieveOrThrow(const nlohmann::json& options = nlohmann::json::object());

  /**
   * @brief Save a new item
   * @param options Must contain "url". Only url, tags, title and tweet_id are sent.
   */
  ApiResult<AddResult> add(const nlohmann::json& options);
  AddResult addOrThrow(const nlohmann::json& options);

  /**
   * @brief Send a batch of actions in one request
   *
   * All actions are stamped with the same timestamp, read once from the clock.
   * The batch itself is left untouched.
   */
  ApiResult<SendResult> send(const core::ActionBatch& batch);

  // Plain action maps, normalized into a batch first
  ApiResult<SendResult> send(const core::ActionMap& action);
  ApiResult<SendResult> send(const std::vector<core::ActionMap>& actions);

  SendResult sendOrThrow(const core::ActionBatch& batch);

 private:
  Result<util::HttpResponse> post(const std::string& path, const nlohmann::json& payload);

  template <typename T>
  ApiResult<T> logFailure(const std::string& path, ApiResult<T> result) const;

  Credentials credentials_;
  std::shared_ptr<util::HttpTransport> transport_;
  Clock clock_;
};

}  // namespace readlater::api

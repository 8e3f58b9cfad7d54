#include "readlater/api/client.hpp"

#include <spdlog/spdlog.h>

#include "readlater/api/request_assembler.hpp"
#include "readlater/util/time.hpp"

namespace readlater::api {

namespace {

const std::vector<std::string> kRequestHeaders = {
    "Content-Type: application/json; charset=UTF-8",
    "X-Accept: application/json",
};

template <typename T>
T valueOrThrow(ApiResult<T> result) {
  if (!result.has_value()) {
    throw ApiException(std::move(result.error()));
  }
  return std::move(*result);
}

}  // namespace

Client::Client(Credentials credentials, std::shared_ptr<util::HttpTransport> transport)
    : credentials_(std::move(credentials)),
      transport_(std::move(transport)),
      clock_(&util::Time::now) {
}

Client::Client(std::string consumer_key, std::string access_token,
               std::shared_ptr<util::HttpTransport> transport)
    : Client(Credentials(std::move(consumer_key), std::move(access_token)),
             std::move(transport)) {
}

void Client::setClock(Clock clock) {
  clock_ = std::move(clock);
}

ApiResult<RetrieveResult> Client::retrieve(const nlohmann::json& options) {
  auto response = post(kRetrievePath, RequestAssembler::retrieve(credentials_, options));
  return logFailure(kRetrievePath,
                    classifyResponse<RetrieveResult>(response, &RetrieveResult::fromJson));
}

RetrieveResult Client::retrieveOrThrow(const nlohmann::json& options) {
  return valueOrThrow(retrieve(options));
}

ApiResult<AddResult> Client::add(const nlohmann::json& options) {
  auto response = post(kAddPath, RequestAssembler::add(credentials_, options));
  return logFailure(kAddPath, classifyResponse<AddResult>(response, &AddResult::fromJson));
}

AddResult Client::addOrThrow(const nlohmann::json& options) {
  return valueOrThrow(add(options));
}

ApiResult<SendResult> Client::send(const core::ActionBatch& batch) {
  auto snapshot = batch.stamped(clock_());
  spdlog::debug("Sending {} action(s)", snapshot.size());

  auto response = post(kSendPath, RequestAssembler::send(credentials_, snapshot));
  return logFailure(kSendPath, classifyResponse<SendResult>(response, &SendResult::fromJson));
}

ApiResult<SendResult> Client::send(const core::ActionMap& action) {
  return send(core::ActionBatch::fromMaps({action}));
}

ApiResult<SendResult> Client::send(const std::vector<core::ActionMap>& actions) {
  return send(core::ActionBatch::fromMaps(actions));
}

SendResult Client::sendOrThrow(const core::ActionBatch& batch) {
  return valueOrThrow(send(batch));
}

Result<util::HttpResponse> Client::post(const std::string& path, const nlohmann::json& payload) {
  const auto url = credentials_.endpoint(path);
  spdlog::debug("POST {}", url);

  auto started = std::chrono::steady_clock::now();
  auto response = transport_->post(url, payload.dump(), kRequestHeaders);
  auto elapsed = std::chrono::steady_clock::now() - started;

  if (response.has_value()) {
    spdlog::debug("POST {} -> {} in {}", url, response->status_code,
                  util::Time::formatDuration(elapsed));
  }
  return response;
}

template <typename T>
ApiResult<T> Client::logFailure(const std::string& path, ApiResult<T> result) const {
  if (!result.has_value()) {
    spdlog::warn("{} failed: {}", path, result.error().describe());
  }
  return result;
}

}  // namespace readlater::api

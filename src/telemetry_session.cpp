#include "foxess/telemetry_session.hpp"
#include "foxess/errors.hpp"
#include "foxess/log.hpp"

#include <algorithm>
#include <exception>

namespace http = boost::beast::http;

namespace foxess {

TelemetrySession::TelemetrySession(const Config &cfg, HttpTransport &transport,
                                   std::string credential)
    : client_(cfg, transport), credential_(std::move(credential)) {}

const std::vector<std::string> &TelemetrySession::realtime_variables() {
  static const std::vector<std::string> vars = {
      "generationPower",    "feedinPower",    "gridConsumptionPower",
      "loadsPower",         "batChargePower", "batDischargePower",
      "SoC",                "batTemperature", "ambientTemperation",
      "invTemperation",     "meterPower2",    "pvPower"};
  return vars;
}

void TelemetrySession::authenticate() {
  // у FoxESS ключ API сразу является токеном
  log_dbg("SESSION", "using API key as token");
  client_.set_token(credential_);
  state_ = SessionState::Authenticated;
}

bool TelemetrySession::test_authentication() {
  log_dbg("SESSION", "testing authentication");
  authenticate();
  try {
    client_.request<PagedDeviceList>(kDeviceListPath, http::verb::post,
                                     DeviceListRequest{1, kDeviceListPageSize});
    return true;
  } catch (const ApiError &e) {
    log_dbg("SESSION", std::string("authentication test failed: ") + e.what());
    return false;
  } catch (const std::exception &e) {
    // сбои вне таксономии ApiError (TLS-контекст, digest) тоже значат "нет"
    log_dbg("SESSION",
            std::string("authentication test failed unexpectedly: ") +
                e.what());
    return false;
  }
}

std::vector<Device> TelemetrySession::list_devices() {
  require_authenticated();
  log_dbg("SESSION", "fetching device list");
  auto page = client_.request<PagedDeviceList>(
      kDeviceListPath, http::verb::post,
      DeviceListRequest{1, kDeviceListPageSize});
  return std::move(page.data);
}

std::vector<TelemetryPoint>
TelemetrySession::fetch_realtime(const std::string &device_sn) {
  require_authenticated();
  log_dbg("SESSION", "fetching real-time data for " + device_sn);

  auto blocks = client_.request<std::vector<RealtimeBlock>>(
      kRealtimeQueryPath, http::verb::post,
      RealtimeQueryRequest{device_sn, realtime_variables()});

  auto it = std::find_if(blocks.begin(), blocks.end(),
                         [&](const RealtimeBlock &b) {
                           return b.device_sn == device_sn;
                         });
  if (it == blocks.end())
    throw DeviceNotFoundInResponse(device_sn);
  return std::move(it->datas);
}

void TelemetrySession::require_authenticated() const {
  if (state_ != SessionState::Authenticated)
    throw NotAuthenticatedError();
}

} // namespace foxess

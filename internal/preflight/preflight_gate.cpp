#include "preflight_gate.hpp"

#include <exception>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/observability/telemetry.hpp"
#include "internal/util/errors.hpp"

namespace vodbridge::preflight {

using content::v1::PreflightCheck;
using content::v1::PreflightReport;

namespace {

void AddFailure(PreflightReport* report, PreflightCheck check, const std::string& message) {
  auto* failure = report->add_failures();
  failure->set_check(check);
  failure->set_message(message);
}

} // namespace

PreflightGate::PreflightGate(std::shared_ptr<backend::ContentFacade>      facade,
                             std::shared_ptr<platform::ExtensionRegistry> registry,
                             std::shared_ptr<platform::SessionStore>      sessions,
                             Options                                      options)
    : facade_(std::move(facade)), registry_(std::move(registry)), sessions_(std::move(sessions)), options_(std::move(options)) {
}

void PreflightGate::CheckLogin(PreflightReport* report) {
  auto logged_in = facade_->LoginState();
  if (!logged_in) {
    logged_in = sessions_ && sessions_->HasSession();
  }
  if (!*logged_in) {
    AddFailure(report, content::v1::PREFLIGHT_CHECK_LOGIN, "not-ready");
  }
}

void PreflightGate::CheckComponent(PreflightReport* report) {
  const auto& id = options_.component_id;
  try {
    if (!registry_->Exists(id)) {
      AddFailure(report, content::v1::PREFLIGHT_CHECK_COMPONENT, id + " is not installed");
    } else if (!registry_->IsEnabled(id)) {
      AddFailure(report, content::v1::PREFLIGHT_CHECK_COMPONENT, id + " is disabled");
    }
  } catch (const std::exception& e) {
    AddFailure(report, content::v1::PREFLIGHT_CHECK_COMPONENT, id + " could not be checked: " + e.what());
  }
}

void PreflightGate::CheckDrm(PreflightReport* report) {
  const auto ready = facade_->DrmReady();
  if (ready.has_value() && !*ready) {
    AddFailure(report, content::v1::PREFLIGHT_CHECK_DRM, "drm is not available");
  }
}

PreflightReport PreflightGate::Evaluate() {
  PreflightReport report;
  if (!options_.enabled) {
    report.set_ready(true);
    return report;
  }

  observability::TraceSpan span("preflight.evaluate");

  CheckLogin(&report);
  CheckComponent(&report);
  CheckDrm(&report);

  report.set_ready(report.failures_size() == 0);
  span.Tag("ready", report.ready());
  observability::Metrics::Instance().RecordPreflight(report.ready());

  if (!report.ready()) {
    for (const auto& failure : report.failures()) {
      VODBRIDGE_LOG_WARN("preflight check failed",
                         {observability::StringField("check", content::v1::PreflightCheck_Name(failure.check())),
                          observability::StringField("message", failure.message())});
    }
  }
  return report;
}

void PreflightGate::EnsureReady() {
  auto report = Evaluate();
  if (report.ready()) {
    return;
  }
  throw util::PreflightError(std::vector<content::v1::PreflightFailure>(report.failures().begin(), report.failures().end()));
}

} // namespace vodbridge::preflight

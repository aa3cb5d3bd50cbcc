#include "flowqos/engine/tick-engine.h"

#include "absl/strings/str_cat.h"
#include "flowqos/alg/qos-actions.h"
#include "flowqos/log/spdlog.h"
#include "flowqos/proto/constructors.h"
#include "flowqos/traffic/traffic-class.h"

namespace flowqos {

namespace {

constexpr absl::Duration kLongLockDur = absl::Milliseconds(100);

const proto::QosRule* FindRule(const std::vector<proto::QosRule>& rules,
                               proto::TrafficClass c) {
  for (const proto::QosRule& r : rules) {
    if (r.traffic_class() == c) {
      return &r;
    }
  }
  return nullptr;
}

void SetTimestamp(absl::Time now, proto::BroadcastMessage* mesg) {
  google::protobuf::Timestamp ts = ToProtoTimestamp(now);
  switch (mesg->kind_case()) {
    case proto::BroadcastMessage::kTrafficUpdate:
      *mesg->mutable_traffic_update()->mutable_timestamp() = ts;
      break;
    case proto::BroadcastMessage::kTrafficByType:
      *mesg->mutable_traffic_by_type()->mutable_timestamp() = ts;
      break;
    case proto::BroadcastMessage::kAllocationUpdate:
      *mesg->mutable_allocation_update()->mutable_timestamp() = ts;
      break;
    case proto::BroadcastMessage::kAlertUpdate:
      *mesg->mutable_alert_update()->mutable_timestamp() = ts;
      break;
    default:
      break;
  }
}

}  // namespace

TickEngine::TickEngine(const EngineOptions& options, Deps deps)
    : options_(options),
      deps_(deps),
      logger_(MakeLogger("tick-engine")),
      upstream_runner_("upstream-io"),
      predictor_runner_("predictor-io"),
      aggregator_(
          StatsAggregator::Config{
              .tick_period = options.tick_period,
              .silence_interval = options.silence_interval,
              .history_length = options.history_length,
          },
          deps.classifier != nullptr ? deps.classifier : &DefaultClassifierTable()),
      over_demand_(3, 2),
      alert_book_(options.alert_cooldown) {
  FQ_SPDLOG_CHECK_MESG(&logger_, deps_.store != nullptr, "need a traffic store");
  FQ_SPDLOG_CHECK_MESG(&logger_, deps_.predictor != nullptr, "need a predictor");
  FQ_SPDLOG_CHECK_MESG(&logger_, deps_.rules != nullptr, "need a rule store");
  FQ_SPDLOG_CHECK_MESG(&logger_, deps_.broadcaster != nullptr, "need a broadcaster");
}

absl::Time TickEngine::NextTimestamp(absl::Time now) {
  if (now <= last_now_) {
    now = last_now_ + absl::Nanoseconds(1);
  }
  last_now_ = now;
  return now;
}

TickEngine::ClassDemand TickEngine::ComputeDemand(
    const std::vector<proto::QosRule>& rules) {
  ClassDemand demand;
  BandwidthPredictor* predictor = deps_.predictor;
  // All of this tick's predictions share one deadline.
  const absl::Time deadline = absl::Now() + options_.predictor_timeout;
  for (proto::TrafficClass c : kQosClasses) {
    std::optional<double> observed;
    std::optional<proto::Prediction> prediction;
    if (aggregator_.HasActiveFlows(c)) {
      observed = aggregator_.ObservedDemand(c);

      absl::StatusOr<proto::Prediction> pred_or =
          absl::DeadlineExceededError("no predictor time left this tick");
      const absl::Duration remaining = deadline - absl::Now();
      if (remaining > absl::ZeroDuration()) {
        proto::PredictionRequest req = aggregator_.BuildPredictionRequest(c);
        pred_or = predictor_runner_.Run<proto::Prediction>(
            remaining, [predictor, req] { return predictor->Predict(req); });
      }
      if (pred_or.ok()) {
        prediction = *pred_or;
        demand.predictions.push_back(*pred_or);
      } else {
        demand.predictor_failed = true;
        SPDLOG_LOGGER_WARN(&logger_, "tick {}: no prediction for {}: {}", tick_,
                           TrafficClassName(c), pred_or.status().ToString());
      }
    }

    DemandEstimate est =
        ResolveDemand(prediction.has_value() ? &*prediction : nullptr,
                      options_.confidence_threshold, observed, FindRule(rules, c));
    demand.mbps[c] = est.mbps;
    demand.source[c] = est.source;
  }
  return demand;
}

void TickEngine::AssignFlowAllocations(
    const std::vector<proto::AllocationResult>& results) {
  std::map<proto::TrafficClass, double> class_alloc;
  for (const proto::AllocationResult& r : results) {
    class_alloc[r.traffic_class()] = r.allocated_mbps();
  }

  // Each class's allocation is split among its flows in proportion to their
  // current bandwidth, or evenly if none of them carry traffic right now.
  std::map<proto::TrafficClass, std::vector<const proto::Flow*>> by_class;
  std::vector<proto::Flow> flows = aggregator_.flows().ActiveFlows();
  for (const proto::Flow& f : flows) {
    by_class[f.traffic_class()].push_back(&f);
  }
  for (const auto& [c, class_flows] : by_class) {
    const double alloc = class_alloc.count(c) > 0 ? class_alloc[c] : 0;
    double total = 0;
    for (const proto::Flow* f : class_flows) {
      total += f->current_bandwidth_mbps();
    }
    for (const proto::Flow* f : class_flows) {
      double share = total > 0 ? f->current_bandwidth_mbps() / total
                               : 1.0 / static_cast<double>(class_flows.size());
      aggregator_.flows().SetAllocated(f->id(), alloc * share);
    }
  }
}

void TickEngine::Tick(absl::Time now) {
  absl::MutexLock tick_lock(&tick_mu_);

  // Rules are fixed for the whole tick; SetRule calls show up on the next one.
  RuleSnapshot rules = deps_.rules->Snapshot();

  TrafficStore* store = deps_.store;
  const int64_t cursor = cursor_;
  absl::StatusOr<SampleBatch> batch = upstream_runner_.Run<SampleBatch>(
      options_.upstream_timeout,
      [store, cursor] { return store->ReadSamplesSince(cursor); });

  TickOutput out;
  {
    MutexLockWarnLong l(&state_mu_, kLongLockDur, &logger_, "state_mu_");
    now = NextTimestamp(now);
    ++tick_;
    if (batch.ok()) {
      cursor_ = batch->next_cursor;
      out = RunHealthy(now, *rules, std::move(batch->samples));
    } else {
      out = PublishDegraded(now, batch.status());
    }
  }
  Persist(std::move(out));
}

TickEngine::TickOutput TickEngine::RunHealthy(absl::Time now,
                                              const std::vector<proto::QosRule>& rules,
                                              std::vector<proto::TrafficSample> samples) {
  TickStats stats = aggregator_.Ingest(now, std::move(samples));
  ClassDemand demand = ComputeDemand(rules);

  AllocationOutput alloc =
      allocator_.Allocate(demand.mbps, rules, options_.total_bandwidth_mbps);
  for (proto::AllocationResult& r : alloc.results) {
    auto it = demand.source.find(r.traffic_class());
    if (it != demand.source.end()) {
      r.set_demand_source(it->second);
    }
  }
  AssignFlowAllocations(alloc.results);

  std::vector<proto::TrafficClass> over_demanded = over_demand_.Update(alloc.results);
  std::vector<proto::Alert> candidates =
      DeriveAlerts(now, alloc.results, rules, over_demanded, stats.new_flows);
  if (demand.predictor_failed) {
    candidates.push_back(MakeAlert(proto::AS_WARNING, kPredictorUnavailableTitle,
                                   "using observed demand or rule minimums", now));
  }
  AlertBook::Changes changes = alert_book_.Update(now, candidates);
  last_candidates_ = std::move(candidates);

  proto::BroadcastMessage traffic;
  traffic.set_tick(tick_);
  {
    proto::TrafficUpdate* u = traffic.mutable_traffic_update();
    *u->mutable_timestamp() = ToProtoTimestamp(now);
    int64_t total_packets = 0;
    int num_listed = 0;
    aggregator_.flows().ForEachActiveFlow([&](const proto::Flow& f) {
      total_packets += f.packet_count();
      if (num_listed < options_.max_flows_per_update) {
        *u->add_flows() = f;
        *u->add_decisions() = DecideQosAction(f, FindRule(rules, f.traffic_class()));
        ++num_listed;
      }
    });
    for (proto::Alert& a : alert_book_.Active()) {
      *u->add_alerts() = std::move(a);
    }
    u->mutable_stats()->set_total_flows(aggregator_.flows().size());
    u->mutable_stats()->set_total_packets(total_packets);
    u->mutable_stats()->set_active_alerts(alert_book_.num_active());
  }

  proto::BroadcastMessage by_type;
  by_type.set_tick(tick_);
  *by_type.mutable_traffic_by_type() = ToTrafficByType(stats);

  proto::BroadcastMessage allocation;
  allocation.set_tick(tick_);
  {
    proto::AllocationUpdate* u = allocation.mutable_allocation_update();
    *u->mutable_timestamp() = ToProtoTimestamp(now);
    for (proto::AllocationResult& r : alloc.results) {
      *u->add_allocations() = std::move(r);
    }
    *u->mutable_summary() = alloc.summary;
  }

  last_messages_ = {traffic, by_type, allocation};
  for (const proto::BroadcastMessage& m : last_messages_) {
    deps_.broadcaster->Publish(m);
  }
  PublishAlertChanges(now, changes);

  if (deps_.alloc_recorder != nullptr) {
    absl::Status st = deps_.alloc_recorder->Record(allocation.allocation_update());
    if (!st.ok()) {
      SPDLOG_LOGGER_WARN(&logger_, "failed to record allocation: {}", st.ToString());
    }
  }

  SPDLOG_LOGGER_INFO(&logger_,
                     "tick {}: {} flows, allocated {} of {} Mbps, {} active alerts",
                     tick_, aggregator_.flows().size(),
                     alloc.summary.total_allocated_mbps(),
                     alloc.summary.total_budget_mbps(), alert_book_.num_active());

  TickOutput out;
  out.tick = tick_;
  out.closed = std::move(stats.closed);
  out.predictions = std::move(demand.predictions);
  out.alerts = std::move(changes.raised);
  out.alerts.insert(out.alerts.end(), changes.resolved.begin(), changes.resolved.end());
  return out;
}

TickEngine::TickOutput TickEngine::PublishDegraded(absl::Time now,
                                                   const absl::Status& read_status) {
  ++num_degraded_ticks_;
  SPDLOG_LOGGER_WARN(&logger_,
                     "tick {}: upstream read failed, reusing previous data: {}", tick_,
                     read_status.ToString());

  proto::Alert degraded =
      MakeAlert(proto::AS_WARNING, kUpstreamDegradedTitle,
                absl::StrCat("sample read failed: ", read_status.message()), now);
  // Nothing was re-evaluated, so the last healthy tick's alerts stay raised.
  std::vector<proto::Alert> candidates = last_candidates_;
  candidates.push_back(degraded);
  AlertBook::Changes changes = alert_book_.Update(now, candidates);
  const proto::Alert* active = alert_book_.FindActive(degraded);
  if (active != nullptr) {
    degraded = *active;
  }

  for (proto::BroadcastMessage m : last_messages_) {
    m.set_tick(tick_);
    SetTimestamp(now, &m);
    if (m.has_traffic_update()) {
      *m.mutable_traffic_update()->add_alerts() = degraded;
    }
    deps_.broadcaster->Publish(m);
  }
  PublishAlertChanges(now, changes);

  TickOutput out;
  out.tick = tick_;
  out.alerts = std::move(changes.raised);
  out.alerts.insert(out.alerts.end(), changes.resolved.begin(), changes.resolved.end());
  return out;
}

void TickEngine::PublishAlertChanges(absl::Time now, const AlertBook::Changes& changes) {
  if (changes.empty()) {
    return;
  }
  proto::BroadcastMessage mesg;
  mesg.set_tick(tick_);
  proto::AlertUpdate* u = mesg.mutable_alert_update();
  *u->mutable_timestamp() = ToProtoTimestamp(now);
  for (const proto::Alert& a : changes.raised) {
    *u->add_alerts() = a;
  }
  for (const proto::Alert& a : changes.resolved) {
    *u->add_alerts() = a;
  }
  deps_.broadcaster->Publish(mesg);

  if (deps_.alert_recorder != nullptr) {
    for (const proto::Alert& a : u->alerts()) {
      absl::Status st = deps_.alert_recorder->Record(a);
      if (!st.ok()) {
        SPDLOG_LOGGER_WARN(&logger_, "failed to record alert: {}", st.ToString());
        break;
      }
    }
  }
}

void TickEngine::Persist(TickOutput out) {
  if (out.closed.empty() && out.predictions.empty() && out.alerts.empty()) {
    return;
  }
  const uint64_t tick = out.tick;
  TrafficStore* store = deps_.store;
  absl::Status st = upstream_runner_.RunStatus(
      options_.upstream_timeout,
      [store, closed = std::move(out.closed), predictions = std::move(out.predictions),
       alerts = std::move(out.alerts)]() -> absl::Status {
        for (const proto::FlowClosed& c : closed) {
          absl::Status record_status = store->RecordFlowClosed(c);
          if (!record_status.ok()) {
            return record_status;
          }
        }
        for (const proto::Prediction& p : predictions) {
          absl::Status record_status = store->RecordPrediction(p);
          if (!record_status.ok()) {
            return record_status;
          }
        }
        for (const proto::Alert& a : alerts) {
          absl::Status record_status = store->RecordAlert(a);
          if (!record_status.ok()) {
            return record_status;
          }
        }
        return absl::OkStatus();
      });
  if (!st.ok()) {
    SPDLOG_LOGGER_WARN(&logger_, "tick {}: failed to persist tick output: {}", tick,
                       st.ToString());
  }
}

void TickEngine::Drain(absl::Time now) {
  MutexLockWarnLong l(&state_mu_, kLongLockDur, &logger_, "state_mu_");
  now = NextTimestamp(now);

  proto::BroadcastMessage mesg;
  mesg.set_tick(tick_);
  proto::AlertUpdate* u = mesg.mutable_alert_update();
  *u->mutable_timestamp() = ToProtoTimestamp(now);
  for (proto::Alert& a : alert_book_.Active()) {
    *u->add_alerts() = std::move(a);
  }
  SPDLOG_LOGGER_INFO(&logger_, "draining {} unresolved alerts", u->alerts_size());
  deps_.broadcaster->Publish(mesg);

  if (deps_.alert_recorder != nullptr) {
    for (const proto::Alert& a : u->alerts()) {
      absl::Status st = deps_.alert_recorder->Record(a);
      if (!st.ok()) {
        SPDLOG_LOGGER_WARN(&logger_, "failed to record alert: {}", st.ToString());
        break;
      }
    }
  }
}

uint64_t TickEngine::num_ticks() const {
  MutexLockWarnLong l(&state_mu_, kLongLockDur, &logger_, "state_mu_");
  return tick_;
}

int64_t TickEngine::num_degraded_ticks() const {
  MutexLockWarnLong l(&state_mu_, kLongLockDur, &logger_, "state_mu_");
  return num_degraded_ticks_;
}

void RunLoop(TickEngine* engine, absl::Duration tick_period,
             std::atomic<bool>* should_exit, spdlog::logger* logger) {
  absl::Time next = absl::Now();
  while (!should_exit->load()) {
    SPDLOG_LOGGER_DEBUG(logger, "{}: run tick", __func__);
    engine->Tick(absl::Now());
    next += tick_period;
    absl::Time now = absl::Now();
    if (next < now) {
      SPDLOG_LOGGER_WARN(logger, "{}: tick overran its period by {}", __func__,
                         absl::FormatDuration(now - next));
      next = now;
    }
    absl::SleepFor(next - now);
  }
}

}  // namespace flowqos

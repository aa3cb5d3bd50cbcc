#include "flowqos/alg/qos-actions.h"

namespace flowqos {

proto::FlowQosDecision DecideQosAction(const proto::Flow& flow,
                                       const proto::QosRule* rule) {
  proto::FlowQosDecision d;
  d.set_flow_id(flow.id());
  if (rule == nullptr || !rule->enabled()) {
    d.set_action(proto::QA_NONE);
    d.set_reason("no_rule");
    return d;
  }

  d.set_dscp(rule->dscp());
  const double bw = flow.current_bandwidth_mbps();
  if (bw > rule->max_bandwidth_mbps()) {
    d.set_action(proto::QA_THROTTLE);
    d.set_target_bandwidth_mbps(rule->max_bandwidth_mbps());
    d.set_reason("exceeds_max");
  } else if (bw < rule->min_bandwidth_mbps()) {
    d.set_action(proto::QA_PRIORITIZE);
    d.set_target_bandwidth_mbps(rule->min_bandwidth_mbps());
    d.set_reason("below_min");
  } else {
    d.set_action(proto::QA_MAINTAIN);
    d.set_target_bandwidth_mbps(bw);
    d.set_reason("within_limits");
  }
  return d;
}

}  // namespace flowqos

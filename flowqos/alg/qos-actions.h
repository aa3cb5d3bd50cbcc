#ifndef FLOWQOS_ALG_QOS_ACTIONS_H_
#define FLOWQOS_ALG_QOS_ACTIONS_H_

#include "flowqos/proto/flowqos.pb.h"

namespace flowqos {

// DecideQosAction compares a flow's current bandwidth to its class rule.
// rule may be null. The decision is advisory and never enforced.
proto::FlowQosDecision DecideQosAction(const proto::Flow& flow,
                                       const proto::QosRule* rule);

}  // namespace flowqos

#endif  // FLOWQOS_ALG_QOS_ACTIONS_H_

#include "action_sink.hpp"

#include <spdlog/spdlog.h>

mw::E<void> LogActionSink::publish(const Action& action)
{
    spdlog::info("Action #{}: {} {} on item {} by {}, reputation of {} is {}",
                 action.seq, actionKindName(action.kind), action.label,
                 action.item_id, action.actor, action.subject,
                 action.reputation);
    return {};
}

mw::E<void> DatabaseActionSink::publish(const Action& action)
{
    return db.appendAction(action);
}

#pragma once
#include <optional>
#include <vector>
#include "queue/queue_item.hpp"

namespace jukebox::stream::queue {

// The task board the coordinator pulls work from. Implementations throw
// std::runtime_error when the board cannot be read or written.
class QueueSource {
public:
    virtual ~QueueSource() = default;

    // Items waiting to be played, in board order.
    virtual std::vector<QueueItem> ListEligibleItems() = 0;

    virtual void ReportState(const QueueItem& item, ItemState state) = 0;

    virtual std::optional<AttachmentRef> GetAttachment(const QueueItem& item) = 0;
};

} // namespace jukebox::stream::queue

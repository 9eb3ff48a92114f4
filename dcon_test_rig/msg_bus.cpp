// msg_bus.cpp
// Event message bus implementation

#include <Arduino.h>
#include "msg_bus.h"
#include "rig_log.h"
#include <string.h>

// Global message bus instance
MessageBus g_message_bus;

// Global broadcast handler (for host link forwarding)
MessageHandler MessageBus::global_broadcast_handler = nullptr;

MessageBus::MessageBus() :
    subscriber_count(0),
    queue_head(0),
    queue_tail(0),
    messages_processed(0),
    queue_overflows(0),
    messages_published(0)
{
    // Initialize subscriber array
    for (uint8_t i = 0; i < MAX_SUBSCRIBERS; i++) {
        subscribers[i].msg_id = 0;
        subscribers[i].handler = nullptr;
    }
}

void MessageBus::init() {
    // Reset queue
    queue_head = 0;
    queue_tail = 0;

    // Reset statistics
    resetStatistics();

    rig_log_debug("MessageBus: Initialization complete");
}

bool MessageBus::subscribe(uint32_t msg_id, MessageHandler handler) {
    if (subscriber_count >= MAX_SUBSCRIBERS || handler == nullptr) {
        rig_log_error("MessageBus: Subscribe failed - too many subscribers or null handler");
        return false;
    }

    subscribers[subscriber_count].msg_id = msg_id;
    subscribers[subscriber_count].handler = handler;
    subscriber_count++;

    rig_log_debug("MessageBus: Subscribed to ID 0x%06lX", (unsigned long)msg_id);

    return true;
}

bool MessageBus::publish(uint32_t msg_id, const void* data, uint8_t length) {
    if (length > RIG_MSG_MAX_PAYLOAD) {
        rig_log_error("MessageBus: Publish failed - data too long");
        return false;
    }

    RigMessage msg;
    memset(&msg, 0, sizeof(msg));
    msg.id = msg_id;
    msg.len = length;
    if (data != nullptr && length > 0) {
        memcpy(msg.buf, data, length);
    }
    msg.timestamp = millis();

    // Add to internal queue
    if (!enqueue_internal_message(msg)) {
        queue_overflows++;
        rig_log_warning("MessageBus: Internal queue overflow, dropped 0x%06lX", (unsigned long)msg_id);
        return false;
    }

    messages_published++;

    return true;
}

bool MessageBus::publishUint8(uint32_t msg_id, uint8_t value) {
    return publish(msg_id, &value, sizeof(uint8_t));
}

void MessageBus::process() {
    process_internal_queue();
}

// Private methods

bool MessageBus::enqueue_internal_message(const RigMessage& msg) {
    uint16_t next_head = next_queue_index(queue_head);

    if (next_head == queue_tail) {
        // Queue is full
        return false;
    }

    internal_queue[queue_head] = msg;
    queue_head = next_head;

    return true;
}

void MessageBus::process_internal_queue() {
    while (queue_tail != queue_head) {
        // Copy out first: a handler may publish and wrap the queue
        RigMessage msg = internal_queue[queue_tail];
        queue_tail = next_queue_index(queue_tail);

        deliver_to_subscribers(msg);
        messages_processed++;
    }
}

void MessageBus::deliver_to_subscribers(const RigMessage& msg) {
    // Call global broadcast handler first (for host link forwarding)
    if (global_broadcast_handler != nullptr) {
        global_broadcast_handler(&msg);
    }

    // Deliver to specific subscribers
    for (uint8_t i = 0; i < subscriber_count; i++) {
        if (subscribers[i].msg_id == msg.id && subscribers[i].handler != nullptr) {
            subscribers[i].handler(&msg);
        }
    }
}

uint16_t MessageBus::next_queue_index(uint16_t index) const {
    return (index + 1) % INTERNAL_QUEUE_SIZE;
}

uint16_t MessageBus::getQueueSize() const {
    if (queue_head >= queue_tail) {
        return queue_head - queue_tail;
    } else {
        return INTERNAL_QUEUE_SIZE - queue_tail + queue_head;
    }
}

bool MessageBus::isQueueFull() const {
    return next_queue_index(queue_head) == queue_tail;
}

void MessageBus::resetStatistics() {
    messages_processed = 0;
    queue_overflows = 0;
    messages_published = 0;
}

void MessageBus::resetSubscribers() {
    subscriber_count = 0;
    for (int i = 0; i < MAX_SUBSCRIBERS; i++) {
        subscribers[i].msg_id = 0;
        subscribers[i].handler = nullptr;
    }
}

void MessageBus::clearQueue() {
    queue_head = 0;
    queue_tail = 0;
}

void MessageBus::setGlobalBroadcastHandler(MessageHandler handler) {
    global_broadcast_handler = handler;
}

void MessageBus::clearGlobalBroadcastHandler() {
    global_broadcast_handler = nullptr;
}

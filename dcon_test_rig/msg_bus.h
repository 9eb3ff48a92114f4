// msg_bus.h
// Event message bus for the DCON test rig
//
// ============================================================================
// MESSAGE BUS OVERVIEW
// ============================================================================
//
// The rig core never calls into the presentation side directly. Everything
// it wants to report (pressure readings, sequence progress, summaries,
// actuator states) is published as a small fixed-size message. Messages are
// copied into a queue and delivered to subscribers from process(), which the
// main loop calls once per pass.
//
//   Transport / Reader / Sequencer / Actuators
//        ↓ publish()
//   ┌─────────────────────────────┐
//   │   Internal queue (RAM)      │
//   └─────────────────────────────┘
//        ↓ process()
//   Subscribers (host link, tests, status LEDs)
//
// Because the queue holds copies, a subscriber always sees the state as it
// was when the event was published, never a half-updated test run.
//
// USAGE:
//
// g_message_bus.init();
// g_message_bus.subscribe(MSG_TEST_PROGRESS, handle_progress);
// g_message_bus.publish(MSG_TEST_PROGRESS, &progress, sizeof(progress));
// g_message_bus.process();   // from loop()
//
// ============================================================================

#ifndef MSG_BUS_H
#define MSG_BUS_H

#include "msg_definitions.h"

class MessageBus {
public:
    // Configuration constants
    static const uint8_t MAX_SUBSCRIBERS = 32;
    static const uint16_t INTERNAL_QUEUE_SIZE = 128;

    // Constructor
    MessageBus();

    // Initialize the message bus
    void init();

    // Subscribe to a message ID
    bool subscribe(uint32_t msg_id, MessageHandler handler);

    // Publish a message to internal queue
    bool publish(uint32_t msg_id, const void* data, uint8_t length);

    // Process all pending messages (call from main loop)
    void process();

    // Single-byte events (link state)
    bool publishUint8(uint32_t msg_id, uint8_t value);

    // Statistics and diagnostics
    uint32_t getMessagesProcessed() const { return messages_processed; }
    uint32_t getQueueOverflows() const { return queue_overflows; }
    uint32_t getMessagesPublished() const { return messages_published; }

    uint16_t getSubscriberCount() const { return subscriber_count; }

    // Queue status
    uint16_t getQueueSize() const;
    bool isQueueFull() const;

    // Reset statistics
    void resetStatistics();

    // Reset subscribers and drop queued messages (for testing)
    void resetSubscribers();
    void clearQueue();

    // Global broadcast callback (called for every message)
    static MessageHandler global_broadcast_handler;
    static void setGlobalBroadcastHandler(MessageHandler handler);
    static void clearGlobalBroadcastHandler();

private:
    // Subscriber management
    struct Subscriber {
        uint32_t msg_id;
        MessageHandler handler;
    };
    Subscriber subscribers[MAX_SUBSCRIBERS];
    uint8_t subscriber_count;

    // Internal message queue (circular buffer)
    RigMessage internal_queue[INTERNAL_QUEUE_SIZE];
    volatile uint16_t queue_head;
    volatile uint16_t queue_tail;

    // Statistics
    uint32_t messages_processed;
    uint32_t queue_overflows;
    uint32_t messages_published;

    // Internal methods
    bool enqueue_internal_message(const RigMessage& msg);
    void process_internal_queue();
    void deliver_to_subscribers(const RigMessage& msg);
    uint16_t next_queue_index(uint16_t index) const;
};

// Global message bus instance
extern MessageBus g_message_bus;

#endif

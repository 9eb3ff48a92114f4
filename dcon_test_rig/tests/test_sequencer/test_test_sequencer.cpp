// tests/test_sequencer/test_test_sequencer.cpp
// Test suite for the automated valve test state machine

#include <iostream>
#include <cassert>
#include <cmath>
#include <string>
#include <vector>

#include "../mock_arduino.h"
#include "../mock_dcon_device.h"

#include "../../rig_config.h"
#include "../../rig_log.h"
#include "../../msg_bus.h"
#include "../../dcon_transport.h"
#include "../../pressure_reader.h"
#include "../../actuator_controller.h"
#include "../../test_sequencer.h"

// Simple test framework
int tests_run = 0;
int tests_passed = 0;

#define TEST(name) \
    void test_##name(); \
    void run_test_##name() { \
        std::cout << "  Running test: " #name "... "; \
        tests_run++; \
        test_##name(); \
        tests_passed++; \
        std::cout << "PASSED" << std::endl; \
    } \
    void test_##name()

static bool near(float a, float b) {
    return std::fabs(a - b) < 0.0001f;
}

// 1 pressure unit per mA above 4 mA
static const calibration_params_t TEST_CALIBRATION = {4.0f, 20.0f, 0.0f, 16.0f};

static const timing_params_t TEST_TIMING = {
    100,    // plus_minus_time_ms
    1000,   // plus_step_time_ms
    1000,   // minus_step_time_ms
    3,      // plus_step
    3,      // minus_step
    100,    // settle_time_ms
    1000,   // pre_ramp_settle_ms
    1000    // poll_interval_ms
};

// Captured bus traffic
static std::vector<test_progress_msg_t> progress_events;
static std::vector<test_summary_msg_t> summary_events;
static std::vector<test_status_msg_t> status_events;

// Cancel hook: request cancel when this step is reported
static TestSequencer* cancel_target = nullptr;
static int cancel_at_step = -1;

void progress_handler(const RigMessage* msg) {
    test_progress_msg_t progress = *MSG_UNPACK_TEST_PROGRESS(msg);
    progress_events.push_back(progress);
    if (cancel_target != nullptr && (int)progress.step_index == cancel_at_step) {
        cancel_target->request_cancel(progress.run_id);
    }
}

void summary_handler(const RigMessage* msg) {
    summary_events.push_back(*MSG_UNPACK_TEST_SUMMARY(msg));
}

void status_handler(const RigMessage* msg) {
    status_events.push_back(*MSG_UNPACK_TEST_STATUS(msg));
}

void setup_test() {
    mock_reset_all();
    rig_log_reset();
    g_message_bus.resetSubscribers();
    g_message_bus.clearQueue();
    MessageBus::clearGlobalBroadcastHandler();
    g_message_bus.subscribe(MSG_TEST_PROGRESS, progress_handler);
    g_message_bus.subscribe(MSG_TEST_SUMMARY, summary_handler);
    g_message_bus.subscribe(MSG_TEST_STATUS, status_handler);
    progress_events.clear();
    summary_events.clear();
    status_events.clear();
    cancel_target = nullptr;
    cancel_at_step = -1;
}

// Everything a sequencer needs, wired to a simulated rig on Serial1
struct RigFixture {
    MockDconDevice device;
    DconTransport transport;
    PressureReader reader;
    ActuatorController actuators;
    TestSequencer sequencer;

    explicit RigFixture(const timing_params_t& timing = TEST_TIMING) :
        device(Serial1),
        reader(transport, RIG_DEFAULT_CONFIG.channels, TEST_CALIBRATION),
        actuators(transport, RIG_DEFAULT_CONFIG.channels),
        sequencer(reader, actuators, timing)
    {
        device.attach();
        transport.connect(RIG_DEFAULT_CONFIG.link);
    }
};

// Run the main loop until the sequencer goes idle
static void run_until_idle(TestSequencer& sequencer) {
    for (int i = 0; i < 100000 && sequencer.is_active(); i++) {
        sequencer.update();
        g_message_bus.process();
        mock_advance_time_ms(10);
    }
    g_message_bus.process();
}

// =============================================================================
// FORWARD RUN
// =============================================================================

TEST(forward_run_with_failed_middle_read) {
    setup_test();
    RigFixture rig;
    rig.device.queue_analog_response(MockDconDevice::analog_line(7.0f));
    rig.device.queue_timeout();
    rig.device.queue_analog_response(MockDconDevice::analog_line(8.0f));

    uint32_t run_id = 0;
    assert(rig.sequencer.start(TEST_PROFILE_FORWARD, &run_id) == SEQ_OK);
    assert(run_id == 1);
    assert(rig.sequencer.is_active());

    run_until_idle(rig.sequencer);

    test_run_snapshot_t run = rig.sequencer.get_snapshot();
    assert(run.status == TEST_STATUS_COMPLETED);
    assert(run.failure == SEQ_FAILURE_NONE);
    assert(run.step_count == 3);
    assert(run.samples_collected == 2);
    assert(near(run.fixed_open_pressure, 4.0f));
    assert(near(run.fixed_close_pressure, 0.0f));

    pressure_sample_t sample;
    assert(rig.sequencer.get_sample(0, &sample) && near(sample.value, 3.0f));
    assert(!rig.sequencer.has_sample(1));
    assert(rig.sequencer.get_sample(2, &sample) && near(sample.value, 4.0f));
    assert(sample.step_index == 2);

    assert(progress_events.size() == 2);
    assert(progress_events[0].step_index == 0);
    assert(progress_events[1].step_index == 2);

    assert(summary_events.size() == 1);
    assert(near(summary_events[0].fixed_open_pressure, 4.0f));
    assert(near(summary_events[0].fixed_close_pressure, 0.0f));

    assert(status_events.size() == 2);
    assert(status_events[0].status == TEST_STATUS_RUNNING);
    assert(status_events[1].status == TEST_STATUS_COMPLETED);
    assert(status_events[1].run_id == 1);
    assert(progress_events[0].run_id == status_events[1].run_id);
}

TEST(forward_run_drives_outputs) {
    setup_test();
    RigFixture rig;
    rig.device.set_default_analog_response(MockDconDevice::analog_line(6.0f));

    rig.sequencer.start(TEST_PROFILE_FORWARD);
    run_until_idle(rig.sequencer);

    // One pumpPlus pulse per step, released each time
    assert(rig.device.count_writes(6, 1) == 3);
    assert(rig.device.count_writes(6, 0) == 4);  // baseline + 3 releases

    // Valve1, valve3 and the pump were switched on for the ramp
    assert(rig.device.count_writes(1, 1) == 1);
    assert(rig.device.count_writes(3, 1) == 1);
    assert(rig.device.count_writes(5, 1) == 1);
    assert(rig.device.count_writes(4, 1) == 0);

    // Shutdown state afterwards
    for (uint8_t channel = 1; channel <= 5; channel++) {
        assert(rig.device.output_state(channel) == 0);
    }
    assert(rig.device.output_state(7) == 1);
    assert(rig.device.get_analog_reads() == 3);
}

TEST(waits_do_not_block_the_loop) {
    setup_test();
    RigFixture rig;
    rig.device.set_default_analog_response(MockDconDevice::analog_line(6.0f));

    rig.sequencer.start(TEST_PROFILE_FORWARD);
    rig.sequencer.update();     // baseline
    rig.sequencer.update();     // pump and valves on
    assert(rig.sequencer.get_phase() == SEQ_PHASE_PRE_RAMP_SETTLE);

    uint32_t before = millis();
    rig.sequencer.update();
    assert(millis() == before);
    assert(rig.sequencer.get_phase() == SEQ_PHASE_PRE_RAMP_SETTLE);

    mock_advance_time_ms(TEST_TIMING.pre_ramp_settle_ms);
    rig.sequencer.update();
    assert(rig.sequencer.get_phase() == SEQ_PHASE_STEP_SAMPLE);

    rig.sequencer.update();
    assert(rig.sequencer.get_phase() == SEQ_PHASE_PULSE_HOLD);
    assert(rig.sequencer.has_sample(0));

    before = millis();
    rig.sequencer.update();
    assert(millis() == before);
    assert(rig.sequencer.get_phase() == SEQ_PHASE_PULSE_HOLD);
}

TEST(all_reads_failing_marks_run_failed) {
    setup_test();
    RigFixture rig;
    rig.device.set_default_timeout();

    rig.sequencer.start(TEST_PROFILE_FORWARD);
    run_until_idle(rig.sequencer);

    test_run_snapshot_t run = rig.sequencer.get_snapshot();
    assert(run.status == TEST_STATUS_FAILED);
    assert(run.failure == SEQ_FAILURE_NO_SAMPLES_COLLECTED);
    assert(near(run.fixed_open_pressure, 0.0f));
    assert(run.samples_collected == 0);

    assert(progress_events.empty());
    assert(summary_events.empty());
    assert(status_events.back().status == TEST_STATUS_FAILED);
    assert(status_events.back().failure == SEQ_FAILURE_NO_SAMPLES_COLLECTED);

    // Rig still left in its shutdown state
    assert(rig.device.output_state(7) == 1);
    assert(rig.device.output_state(5) == 0);
}

TEST(second_start_is_rejected) {
    setup_test();
    RigFixture rig;
    rig.device.set_default_analog_response(MockDconDevice::analog_line(6.0f));

    uint32_t run_id = 0;
    assert(rig.sequencer.start(TEST_PROFILE_FORWARD, &run_id) == SEQ_OK);

    uint32_t second_id = 99;
    assert(rig.sequencer.start(TEST_PROFILE_FORWARD, &second_id) == SEQ_ERROR_ALREADY_RUNNING);
    assert(second_id == 99);
    assert(rig.sequencer.get_snapshot().run_id == run_id);
    assert(rig.sequencer.get_phase() == SEQ_PHASE_BASELINE);

    run_until_idle(rig.sequencer);

    // A new run is accepted once the first one finished
    assert(rig.sequencer.start(TEST_PROFILE_FORWARD, &second_id) == SEQ_OK);
    assert(second_id == run_id + 1);
}

// =============================================================================
// CANCELLATION
// =============================================================================

TEST(cancel_during_iteration_keeps_earlier_samples) {
    timing_params_t timing = TEST_TIMING;
    timing.plus_step = 5;

    setup_test();
    RigFixture rig(timing);
    rig.device.set_default_analog_response(MockDconDevice::analog_line(7.0f));
    cancel_target = &rig.sequencer;
    cancel_at_step = 1;

    rig.sequencer.start(TEST_PROFILE_FORWARD);
    run_until_idle(rig.sequencer);

    test_run_snapshot_t run = rig.sequencer.get_snapshot();
    assert(run.cancel_requested);
    assert(run.status == TEST_STATUS_COMPLETED);
    assert(run.samples_collected == 2);
    assert(rig.sequencer.has_sample(0));
    assert(rig.sequencer.has_sample(1));
    for (uint16_t step = 2; step < 5; step++) {
        assert(!rig.sequencer.has_sample(step));
    }

    // The step in progress finished its pulse before the cancel was seen
    assert(rig.device.count_writes(6, 1) == 2);
    assert(rig.device.get_analog_reads() == 2);
    assert(rig.device.output_state(7) == 1);
    assert(summary_events.size() == 1);
}

TEST(cancel_before_activation_leaves_pump_off) {
    setup_test();
    RigFixture rig;
    rig.device.set_default_analog_response(MockDconDevice::analog_line(7.0f));

    uint32_t run_id = 0;
    rig.sequencer.start(TEST_PROFILE_FORWARD, &run_id);
    assert(!rig.sequencer.request_cancel(run_id + 1));
    assert(rig.sequencer.request_cancel(run_id));

    rig.sequencer.update();     // baseline
    rig.sequencer.update();     // activation sees the request

    assert(rig.sequencer.get_snapshot().status == TEST_STATUS_CANCELLING);
    assert(rig.sequencer.get_phase() == SEQ_PHASE_FINISH);
    assert(rig.sequencer.is_active());
    assert(rig.device.count_writes(5, 1) == 0);
    assert(rig.device.count_writes(1, 1) == 0);
    assert(rig.device.count_writes(3, 1) == 0);

    rig.sequencer.update();
    assert(!rig.sequencer.is_active());
    assert(rig.sequencer.get_snapshot().status == TEST_STATUS_FAILED);
    assert(rig.device.get_analog_reads() == 0);
    assert(rig.device.output_state(5) == 0);

    // Nothing left to cancel
    assert(!rig.sequencer.request_cancel(run_id));
}

TEST(cancel_is_seen_at_iteration_top) {
    setup_test();
    RigFixture rig;
    rig.device.set_default_analog_response(MockDconDevice::analog_line(7.0f));

    uint32_t run_id = 0;
    rig.sequencer.start(TEST_PROFILE_FORWARD, &run_id);
    rig.sequencer.update();     // baseline
    rig.sequencer.update();     // pump and valves on
    assert(rig.device.count_writes(5, 1) == 1);

    // Requested while settling; the wait still runs out first
    assert(rig.sequencer.request_cancel(run_id));
    rig.sequencer.update();
    assert(rig.sequencer.get_phase() == SEQ_PHASE_PRE_RAMP_SETTLE);

    mock_advance_time_ms(TEST_TIMING.pre_ramp_settle_ms);
    rig.sequencer.update();     // settle done
    rig.sequencer.update();     // top of step 0 sees the request

    assert(rig.sequencer.get_snapshot().status == TEST_STATUS_CANCELLING);
    assert(rig.sequencer.get_phase() == SEQ_PHASE_FINISH);

    rig.sequencer.update();
    assert(!rig.sequencer.is_active());
    assert(rig.sequencer.get_snapshot().status == TEST_STATUS_FAILED);
    assert(rig.device.get_analog_reads() == 0);
    assert(rig.device.output_state(5) == 0);
}

// =============================================================================
// PROFILES AND TIMING
// =============================================================================

TEST(reverse_profile_not_implemented) {
    setup_test();
    RigFixture rig;

    assert(rig.sequencer.start(TEST_PROFILE_REVERSE) == SEQ_ERROR_PROFILE_NOT_IMPLEMENTED);
    assert(!rig.sequencer.is_active());
    assert(rig.device.frames().empty());

    const test_profile_descriptor_t* reverse = TestSequencer::get_profile_descriptor(TEST_PROFILE_REVERSE);
    assert(reverse != nullptr);
    assert(reverse->to_valve == ACTUATOR_VALVE2);
    assert(reverse->from_valve == ACTUATOR_VALVE4);
    assert(reverse->ramp_actuator == ACTUATOR_PUMP_MINUS);
    assert(TestSequencer::get_profile_descriptor(TEST_PROFILE_COUNT) == nullptr);
}

TEST(invalid_timing_is_refused) {
    setup_test();
    timing_params_t bad = TEST_TIMING;
    bad.plus_step = 0;

    RigFixture rig(bad);
    assert(rig.sequencer.start(TEST_PROFILE_FORWARD) == SEQ_ERROR_INVALID_TIMING);
    assert(!rig.sequencer.is_active());

    assert(!rig.sequencer.set_timing(bad));
    assert(rig.sequencer.set_timing(TEST_TIMING));
    assert(rig.sequencer.start(TEST_PROFILE_FORWARD) == SEQ_OK);

    // Locked while the run is active
    assert(!rig.sequencer.set_timing(TEST_TIMING));
}

TEST(status_strings) {
    assert(std::string(test_status_to_string(TEST_STATUS_COMPLETED)) == "COMPLETED");
    assert(std::string(seq_failure_to_string(SEQ_FAILURE_NO_SAMPLES_COLLECTED)) == "NO_SAMPLES_COLLECTED");
    assert(std::string(seq_error_to_string(SEQ_ERROR_ALREADY_RUNNING)) == "test already running");
    assert(std::string(test_profile_to_string(TEST_PROFILE_FORWARD)) == "forward");
}

// Main test runner
int main() {
    std::cout << "=== Test Sequencer Tests ===" << std::endl;

    run_test_forward_run_with_failed_middle_read();
    run_test_forward_run_drives_outputs();
    run_test_waits_do_not_block_the_loop();
    run_test_all_reads_failing_marks_run_failed();
    run_test_second_start_is_rejected();
    run_test_cancel_during_iteration_keeps_earlier_samples();
    run_test_cancel_before_activation_leaves_pump_off();
    run_test_cancel_is_seen_at_iteration_top();
    run_test_reverse_profile_not_implemented();
    run_test_invalid_timing_is_refused();
    run_test_status_strings();

    std::cout << std::endl;
    std::cout << "Test Sequencer Tests - Run: " << tests_run << ", Passed: " << tests_passed << std::endl;

    if (tests_passed == tests_run) {
        std::cout << "✅ ALL TEST SEQUENCER TESTS PASSED!" << std::endl;
        return 0;
    } else {
        std::cout << "❌ SOME TEST SEQUENCER TESTS FAILED!" << std::endl;
        return 1;
    }
}

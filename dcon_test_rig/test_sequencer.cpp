// test_sequencer.cpp
// Automated ramp-and-sample valve test

#include "test_sequencer.h"
#include "msg_bus.h"
#include "rig_log.h"
#include <string.h>

// Indexed by test_profile_t
static const test_profile_descriptor_t PROFILE_TABLE[TEST_PROFILE_COUNT] = {
    {TEST_PROFILE_FORWARD, "forward", ACTUATOR_VALVE1, ACTUATOR_VALVE3, ACTUATOR_PUMP_PLUS, true},
    {TEST_PROFILE_REVERSE, "reverse", ACTUATOR_VALVE2, ACTUATOR_VALVE4, ACTUATOR_PUMP_MINUS, false}
};

TestSequencer::TestSequencer(PressureReader& reader_ref, ActuatorController& actuators_ref,
                             const timing_params_t& initial_timing) :
    reader(reader_ref),
    actuators(actuators_ref),
    timing(initial_timing),
    descriptor(nullptr),
    phase(SEQ_PHASE_IDLE),
    phase_deadline_ms(0),
    step_time_ms(0),
    next_run_id(1)
{
    memset(&run, 0, sizeof(run));
    run.status = TEST_STATUS_IDLE;
    memset(samples, 0, sizeof(samples));
    memset(sample_filled, 0, sizeof(sample_filled));
}

// =============================================================================
// CONTROL
// =============================================================================

seq_error_t TestSequencer::start(test_profile_t profile, uint32_t* run_id_out) {
    if (is_active()) {
        rig_log_warning("Sequencer: Test %lu already running", (unsigned long)run.run_id);
        return SEQ_ERROR_ALREADY_RUNNING;
    }

    const test_profile_descriptor_t* requested = get_profile_descriptor(profile);
    if (requested == nullptr) {
        rig_log_error("Sequencer: Unknown test profile %d", (int)profile);
        return SEQ_ERROR_UNKNOWN_PROFILE;
    }

    if (!requested->implemented) {
        rig_log_info("Sequencer: Starting %s test", requested->name);
        rig_log_warning("Sequencer: %s test is not implemented", requested->name);
        return SEQ_ERROR_PROFILE_NOT_IMPLEMENTED;
    }

    if (!rig_validate_timing(timing)) {
        return SEQ_ERROR_INVALID_TIMING;
    }

    descriptor = requested;
    uint16_t step_count = (profile == TEST_PROFILE_FORWARD) ? timing.plus_step : timing.minus_step;
    step_time_ms = (profile == TEST_PROFILE_FORWARD) ? timing.plus_step_time_ms : timing.minus_step_time_ms;

    float fixed_close = run.fixed_close_pressure;
    memset(&run, 0, sizeof(run));
    run.run_id = next_run_id++;
    run.profile = profile;
    run.status = TEST_STATUS_RUNNING;
    run.failure = SEQ_FAILURE_NONE;
    run.step_count = step_count;
    run.fixed_close_pressure = fixed_close;

    memset(samples, 0, sizeof(samples));
    memset(sample_filled, 0, sizeof(sample_filled));

    phase = SEQ_PHASE_BASELINE;
    phase_deadline_ms = millis();

    rig_log_info("Sequencer: Starting %s test %lu (%u steps)",
                 descriptor->name, (unsigned long)run.run_id, step_count);
    publish_status();

    if (run_id_out != nullptr) {
        *run_id_out = run.run_id;
    }
    return SEQ_OK;
}

bool TestSequencer::request_cancel(uint32_t run_id) {
    if (!is_active() || run_id != run.run_id) {
        return false;
    }
    if (!run.cancel_requested) {
        run.cancel_requested = true;
        rig_log_info("Sequencer: Cancel requested for test %lu", (unsigned long)run_id);
    }
    return true;
}

void TestSequencer::update() {
    switch (phase) {
        case SEQ_PHASE_IDLE:
            break;

        case SEQ_PHASE_BASELINE:
            run_baseline();
            break;

        case SEQ_PHASE_ACTIVATE:
            run_activate();
            break;

        case SEQ_PHASE_PRE_RAMP_SETTLE:
            if (deadline_reached()) {
                run.step_index = 0;
                phase = SEQ_PHASE_STEP_SAMPLE;
            }
            break;

        case SEQ_PHASE_STEP_SAMPLE:
            run_step_sample();
            break;

        case SEQ_PHASE_PULSE_HOLD:
            if (deadline_reached()) {
                actuators.set(descriptor->ramp_actuator, false);
                phase_deadline_ms = millis() + step_time_ms;
                phase = SEQ_PHASE_STEP_WAIT;
            }
            break;

        case SEQ_PHASE_STEP_WAIT:
            if (deadline_reached()) {
                run.step_index++;
                phase = SEQ_PHASE_STEP_SAMPLE;
            }
            break;

        case SEQ_PHASE_FINISH:
            run_finish();
            break;
    }
}

// =============================================================================
// PHASES
// =============================================================================

void TestSequencer::run_baseline() {
    actuators.apply_baseline();
    phase = SEQ_PHASE_ACTIVATE;
}

void TestSequencer::run_activate() {
    // Stopped before the pump came on: leave it off
    if (run.cancel_requested) {
        run.status = TEST_STATUS_CANCELLING;
        rig_log_info("Sequencer: Test %lu cancelled before activation",
                     (unsigned long)run.run_id);
        phase = SEQ_PHASE_FINISH;
        return;
    }

    // Failures are logged by the actuator controller; the ramp still runs so
    // the operator sees the readings
    actuators.set(ACTUATOR_PUMP_START, true);
    actuators.set(descriptor->to_valve, true);
    actuators.set(descriptor->from_valve, true);

    phase_deadline_ms = millis() + timing.pre_ramp_settle_ms;
    phase = SEQ_PHASE_PRE_RAMP_SETTLE;
}

void TestSequencer::run_step_sample() {
    if (run.step_index >= run.step_count) {
        phase = SEQ_PHASE_FINISH;
        return;
    }

    if (run.cancel_requested) {
        run.status = TEST_STATUS_CANCELLING;
        rig_log_info("Sequencer: Test %lu cancelled before step %u",
                     (unsigned long)run.run_id, run.step_index);
        phase = SEQ_PHASE_FINISH;
        return;
    }

    pressure_sample_t sample;
    if (reader.read_pressure(&sample, run.step_index)) {
        samples[run.step_index] = sample;
        sample_filled[run.step_index] = true;
        run.samples_collected++;

        test_progress_msg_t progress;
        progress.run_id = run.run_id;
        progress.step_index = run.step_index;
        progress.pressure = sample.value;
        g_message_bus.publish(MSG_TEST_PROGRESS, &progress, sizeof(progress));

        rig_log_info("Step %u. Pressure: %.2f", run.step_index, sample.value);
    }

    actuators.set(descriptor->ramp_actuator, true);
    phase_deadline_ms = millis() + timing.plus_minus_time_ms;
    phase = SEQ_PHASE_PULSE_HOLD;
}

void TestSequencer::run_finish() {
    bool have_samples = false;
    float open_pressure = 0.0f;
    for (uint16_t i = 0; i < run.step_count; i++) {
        if (!sample_filled[i]) continue;
        if (!have_samples || samples[i].value > open_pressure) {
            open_pressure = samples[i].value;
        }
        have_samples = true;
    }

    run.fixed_open_pressure = open_pressure;

    if (have_samples) {
        run.status = TEST_STATUS_COMPLETED;
        run.failure = SEQ_FAILURE_NONE;

        rig_log_info("Fixed opening pressure: %.2f", run.fixed_open_pressure);
        rig_log_info("Fixed closing pressure: %.2f", run.fixed_close_pressure);

        test_summary_msg_t summary;
        summary.fixed_open_pressure = run.fixed_open_pressure;
        summary.fixed_close_pressure = run.fixed_close_pressure;
        g_message_bus.publish(MSG_TEST_SUMMARY, &summary, sizeof(summary));
    } else {
        run.status = TEST_STATUS_FAILED;
        run.failure = SEQ_FAILURE_NO_SAMPLES_COLLECTED;
        rig_log_error("Sequencer: Test %lu collected no pressure samples",
                      (unsigned long)run.run_id);
    }

    actuators.apply_shutdown();

    phase = SEQ_PHASE_IDLE;
    rig_log_info("Sequencer: Test %lu %s", (unsigned long)run.run_id,
                 test_status_to_string(run.status));
    publish_status();
}

// =============================================================================
// QUERIES
// =============================================================================

bool TestSequencer::is_active() const {
    return run.status == TEST_STATUS_RUNNING || run.status == TEST_STATUS_CANCELLING;
}

test_run_snapshot_t TestSequencer::get_snapshot() const {
    return run;
}

bool TestSequencer::has_sample(uint16_t step_index) const {
    if (step_index > RIG_MAX_STEPS) return false;
    return sample_filled[step_index];
}

bool TestSequencer::get_sample(uint16_t step_index, pressure_sample_t* sample_out) const {
    if (!has_sample(step_index) || sample_out == nullptr) return false;
    *sample_out = samples[step_index];
    return true;
}

bool TestSequencer::set_timing(const timing_params_t& new_timing) {
    if (is_active()) {
        rig_log_warning("Sequencer: Timing cannot change while a test is running");
        return false;
    }
    if (!rig_validate_timing(new_timing)) {
        return false;
    }
    timing = new_timing;
    return true;
}

const test_profile_descriptor_t* TestSequencer::get_profile_descriptor(test_profile_t profile) {
    if ((int)profile < 0 || (int)profile >= TEST_PROFILE_COUNT) return nullptr;
    return &PROFILE_TABLE[profile];
}

bool TestSequencer::deadline_reached() const {
    return (int32_t)(millis() - phase_deadline_ms) >= 0;
}

void TestSequencer::publish_status() {
    test_status_msg_t status;
    memset(&status, 0, sizeof(status));
    status.run_id = run.run_id;
    status.profile = (uint8_t)run.profile;
    status.status = (uint8_t)run.status;
    status.failure = (uint8_t)run.failure;
    g_message_bus.publish(MSG_TEST_STATUS, &status, sizeof(status));
}

// =============================================================================
// STRINGS
// =============================================================================

const char* seq_error_to_string(seq_error_t error) {
    switch (error) {
        case SEQ_OK:                            return "OK";
        case SEQ_ERROR_ALREADY_RUNNING:         return "test already running";
        case SEQ_ERROR_PROFILE_NOT_IMPLEMENTED: return "profile not implemented";
        case SEQ_ERROR_INVALID_TIMING:          return "invalid timing";
        case SEQ_ERROR_UNKNOWN_PROFILE:         return "unknown profile";
        default:                                return "unknown";
    }
}

const char* test_status_to_string(test_status_t status) {
    switch (status) {
        case TEST_STATUS_IDLE:       return "IDLE";
        case TEST_STATUS_RUNNING:    return "RUNNING";
        case TEST_STATUS_CANCELLING: return "CANCELLING";
        case TEST_STATUS_COMPLETED:  return "COMPLETED";
        case TEST_STATUS_FAILED:     return "FAILED";
        default:                     return "UNKNOWN";
    }
}

const char* test_profile_to_string(test_profile_t profile) {
    const test_profile_descriptor_t* entry = TestSequencer::get_profile_descriptor(profile);
    return entry != nullptr ? entry->name : "unknown";
}

const char* seq_failure_to_string(seq_failure_t failure) {
    switch (failure) {
        case SEQ_FAILURE_NONE:                 return "NONE";
        case SEQ_FAILURE_NO_SAMPLES_COLLECTED: return "NO_SAMPLES_COLLECTED";
        default:                               return "UNKNOWN";
    }
}

#pragma once
#include <cstddef>
#include <string>
#include <vector>

/*
  Scheduler parameters. One instance is built at startup (defaults or a
  config file) and handed to every Scheduler by const reference, so a
  per-learner weight table is just another instance.

  Config file format, one setting per line:
      # comment
      request_retention = 0.9
      learning_steps = 1, 10
      weights = 0.4072, 1.1829, ...
*/
struct SchedulerConfig {
    static constexpr std::size_t WEIGHT_COUNT = 19;
    // Upper bound for any interval; keeps due dates representable by Clock.
    static constexpr int MAX_INTERVAL_LIMIT = 36500;

    // w17 and w18 are part of the published table but not read here;
    // fuzz is driven by fuzz_min_interval and fuzz_factor below.
    std::vector<double> weights;
    double request_retention = 0.9;
    std::vector<int> learning_steps;   // minutes
    std::vector<int> relearning_steps; // minutes
    int graduating_interval = 1;       // days
    int easy_interval = 4;             // days
    int maximum_interval = 36500;      // days
    bool enable_fuzz = true;
    double fuzz_min_interval = 2.5;
    double fuzz_factor = 0.05;
    std::string log_level = "info";

    static SchedulerConfig defaults();
    static SchedulerConfig parse(const std::string& text);
    static SchedulerConfig loadFile(const std::string& filename);

    // Throws ConfigError on any setting that could break the record invariants.
    void validate() const;
};

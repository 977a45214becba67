#include "SchedulerConfig.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <spdlog/spdlog.h>

namespace {

// FSRS-4.5 default weights
const std::vector<double> DEFAULT_WEIGHTS = {
    0.4072, 1.1829, 3.1262, 15.4722, // w0..w3: initial stability per rating
    7.2102, 0.5316,                  // w4, w5: initial difficulty
    1.0651, 0.0234,                  // w6, w7: difficulty mean reversion
    1.616, 0.1544, 1.0824,           // w8..w10: recall stability growth
    1.9813, 0.0953, 0.2975, 2.2261,  // w11..w14: forget stability
    0.2553, 0.0,                     // w15 hard penalty, w16 easy bonus
    2.7, 0.05                        // w17, w18: unused, see fuzz_* settings
};

std::string trim(const std::string& s) {
    std::string t = s;
    while (!t.empty() && std::isspace((unsigned char)t.front())) t.erase(t.begin());
    while (!t.empty() && std::isspace((unsigned char)t.back())) t.pop_back();
    return t;
}

double toDouble(const std::string& key, const std::string& value) {
    std::size_t used = 0;
    double v = 0.0;
    try {
        v = std::stod(value, &used);
    }
    catch (const std::exception&) {
        throw ConfigError(key + ": '" + value + "' is not a number");
    }
    if (used != value.size()) throw ConfigError(key + ": trailing characters in '" + value + "'");
    return v;
}

int toInt(const std::string& key, const std::string& value) {
    double v = toDouble(key, value);
    if (v != std::floor(v)) throw ConfigError(key + ": '" + value + "' is not an integer");
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max())
        throw ConfigError(key + ": '" + value + "' is out of range");
    return static_cast<int>(v);
}

bool toBool(const std::string& key, const std::string& value) {
    if (value == "true" || value == "1") return true;
    if (value == "false" || value == "0") return false;
    throw ConfigError(key + ": '" + value + "' is not a boolean");
}

template <typename T, typename Conv>
std::vector<T> toList(const std::string& key, const std::string& value, Conv conv) {
    std::vector<T> out;
    std::istringstream iss(value);
    std::string item;
    while (std::getline(iss, item, ',')) {
        item = trim(item);
        if (item.empty()) throw ConfigError(key + ": empty list element");
        out.push_back(conv(key, item));
    }
    return out;
}

} // namespace

SchedulerConfig SchedulerConfig::defaults() {
    SchedulerConfig cfg;
    cfg.weights = DEFAULT_WEIGHTS;
    cfg.learning_steps = { 1, 10 };
    cfg.relearning_steps = { 10 };
    return cfg;
}

SchedulerConfig SchedulerConfig::parse(const std::string& text) {
    SchedulerConfig cfg = defaults();
    std::istringstream iss(text);
    std::string line;
    int line_no = 0;

    while (std::getline(iss, line)) {
        ++line_no;
        auto hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        line = trim(line);
        if (line.empty()) continue;

        auto pos = line.find('=');
        if (pos == std::string::npos)
            throw ConfigError("line " + std::to_string(line_no) + ": expected key = value");

        std::string key = trim(line.substr(0, pos));
        std::string value = trim(line.substr(pos + 1));
        if (key.empty() || value.empty())
            throw ConfigError("line " + std::to_string(line_no) + ": empty key or value");

        if (key == "weights") cfg.weights = toList<double>(key, value, toDouble);
        else if (key == "request_retention") cfg.request_retention = toDouble(key, value);
        else if (key == "learning_steps") cfg.learning_steps = toList<int>(key, value, toInt);
        else if (key == "relearning_steps") cfg.relearning_steps = toList<int>(key, value, toInt);
        else if (key == "graduating_interval") cfg.graduating_interval = toInt(key, value);
        else if (key == "easy_interval") cfg.easy_interval = toInt(key, value);
        else if (key == "maximum_interval") cfg.maximum_interval = toInt(key, value);
        else if (key == "enable_fuzz") cfg.enable_fuzz = toBool(key, value);
        else if (key == "fuzz_min_interval") cfg.fuzz_min_interval = toDouble(key, value);
        else if (key == "fuzz_factor") cfg.fuzz_factor = toDouble(key, value);
        else if (key == "log_level") cfg.log_level = value;
        else spdlog::warn("Ignoring unknown config key '{}' on line {}", key, line_no);
    }

    cfg.validate();
    return cfg;
}

SchedulerConfig SchedulerConfig::loadFile(const std::string& filename) {
    spdlog::info("Loading scheduler config from '{}'", filename);
    std::ifstream in(filename);
    if (!in) {
        throw ConfigError("cannot open '" + filename + "'");
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    return parse(oss.str());
}

void SchedulerConfig::validate() const {
    if (weights.size() != WEIGHT_COUNT)
        throw ConfigError("expected " + std::to_string(WEIGHT_COUNT) + " weights, got " + std::to_string(weights.size()));
    if (std::any_of(weights.begin(), weights.end(), [](double w) { return !std::isfinite(w); }))
        throw ConfigError("weights contain non-finite values");

    if (!(request_retention > 0.0 && request_retention < 1.0))
        throw ConfigError("request_retention must be in (0, 1)");

    if (learning_steps.empty() || relearning_steps.empty())
        throw ConfigError("learning and relearning steps must not be empty");
    auto bad_step = [](int m) { return m <= 0 || m > MAX_INTERVAL_LIMIT * 24 * 60; };
    if (std::any_of(learning_steps.begin(), learning_steps.end(), bad_step) ||
        std::any_of(relearning_steps.begin(), relearning_steps.end(), bad_step))
        throw ConfigError("steps must be positive minute counts no longer than maximum_interval allows");

    if (graduating_interval < 1 || easy_interval < graduating_interval || maximum_interval < easy_interval)
        throw ConfigError("need 1 <= graduating_interval <= easy_interval <= maximum_interval");
    if (maximum_interval > MAX_INTERVAL_LIMIT)
        throw ConfigError("maximum_interval must not exceed " + std::to_string(MAX_INTERVAL_LIMIT) + " days");

    if (!std::isfinite(fuzz_min_interval) || !std::isfinite(fuzz_factor) || fuzz_factor < 0.0)
        throw ConfigError("fuzz settings must be finite and non-negative");
}

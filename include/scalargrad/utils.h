#pragma once

#include <cmath>
#include <cstddef>
#include <fstream>
#include <numbers>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace scalargrad {

/**
 * Random number generator (shared)
 */
inline std::mt19937& get_rng() {
    static std::mt19937 rng(42);
    return rng;
}

/**
 * Sample uniformly from [lo, hi)
 */
inline double uniform(double lo, double hi) {
    std::uniform_real_distribution<double> dist(lo, hi);
    return dist(get_rng());
}

/**
 * One labelled 2-D sample
 */
struct DataPoint {
    double x;
    double y;
    double label;
};

/**
 * Features and labels split out for feeding a model
 */
struct Dataset {
    std::vector<std::vector<double>> xs;
    std::vector<double> ys;

    size_t size() const { return ys.size(); }
};

inline Dataset to_dataset(const std::vector<DataPoint>& points) {
    Dataset data;
    data.xs.reserve(points.size());
    data.ys.reserve(points.size());
    for (const auto& p : points) {
        data.xs.push_back({p.x, p.y});
        data.ys.push_back(p.label);
    }
    return data;
}

/**
 * Read "x,y,label" rows from a CSV file. The first row is a header and is
 * skipped, as are blank lines. Throws std::runtime_error if the file cannot be
 * opened or a row does not hold three numbers.
 */
inline std::vector<DataPoint> read_csv_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open " + filename);
    }

    std::vector<DataPoint> points;
    std::string line;
    size_t line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        if (line_no == 1) {
            continue;  // header
        }
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }

        std::stringstream row(line);
        std::string field;
        std::vector<double> fields;
        while (std::getline(row, field, ',')) {
            size_t consumed = 0;
            double parsed = 0.0;
            try {
                parsed = std::stod(field, &consumed);
            } catch (const std::exception&) {
                throw std::runtime_error(filename + ":" + std::to_string(line_no) +
                                         ": not a number: '" + field + "'");
            }
            if (field.find_first_not_of(" \t", consumed) != std::string::npos) {
                throw std::runtime_error(filename + ":" + std::to_string(line_no) +
                                         ": not a number: '" + field + "'");
            }
            fields.push_back(parsed);
        }
        if (fields.size() < 3) {
            throw std::runtime_error(filename + ":" + std::to_string(line_no) +
                                     ": expected 3 fields, got " + std::to_string(fields.size()));
        }
        points.push_back({fields[0], fields[1], fields[2]});
    }
    return points;
}

inline Dataset load_moons_data(const std::string& filename = "make_moons.csv") {
    return to_dataset(read_csv_file(filename));
}

/**
 * Two interleaving half circles with gaussian noise. The upper moon is
 * labelled -1, the lower one +1.
 */
inline Dataset make_moons(size_t n_samples, double noise) {
    const size_t n_outer = n_samples / 2;
    const size_t n_inner = n_samples - n_outer;

    auto angle = [](size_t i, size_t n) {
        return n > 1 ? std::numbers::pi * static_cast<double>(i) / static_cast<double>(n - 1) : 0.0;
    };

    std::vector<DataPoint> points;
    points.reserve(n_samples);
    for (size_t i = 0; i < n_outer; ++i) {
        const double t = angle(i, n_outer);
        points.push_back({std::cos(t), std::sin(t), -1.0});
    }
    for (size_t i = 0; i < n_inner; ++i) {
        const double t = angle(i, n_inner);
        points.push_back({1.0 - std::cos(t), 1.0 - std::sin(t) - 0.5, 1.0});
    }

    if (noise > 0.0) {
        std::normal_distribution<double> dist(0.0, noise);
        auto& rng = get_rng();
        for (auto& p : points) {
            p.x += dist(rng);
            p.y += dist(rng);
        }
    }
    return to_dataset(points);
}

}  // namespace scalargrad

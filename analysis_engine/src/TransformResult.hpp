#pragma once

#include <string>
#include <vector>

#include "ParamSchema.hpp"

// Output of one transform call.
//
// image is row-major, rows x cols: rows are frequency / scale / node index,
// cols are time index. yAxis has one entry per row, xAxis one per column
// (seconds). yLabel tells the consumer what yAxis holds: "Hz" for physical
// frequency, anything else for an opaque ordinal. meta carries free-form
// annotations such as per-row labels ("labels" -> list of strings).
//
// Every transform call returns a fresh result; nothing aliases plugin state.
struct TransformResult {
    int rows = 0;
    int cols = 0;
    std::vector<float>  image;
    std::vector<double> yAxis;
    std::vector<double> xAxis;
    std::string yLabel;
    ParamMap    meta;

    void resize(int r, int c) {
        rows = r;
        cols = c;
        image.assign(static_cast<size_t>(r) * static_cast<size_t>(c), 0.0f);
    }

    float& at(int r, int c) { return image[static_cast<size_t>(r) * cols + c]; }
    float  at(int r, int c) const { return image[static_cast<size_t>(r) * cols + c]; }

    bool empty() const { return rows == 0 || cols == 0; }
};

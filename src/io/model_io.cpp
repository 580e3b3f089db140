#include "ffcc/io/model_io.hpp"
#include "ffcc/core/errors.hpp"
#include "ffcc/core/utils.hpp"

#include <vector>

namespace ffcc::io {

static json parse_file(const fs::path& path) {
    try {
        return json::parse(core::read_text(path));
    } catch (const json::exception& e) {
        throw IOError("Cannot parse " + path.string() + ": " + e.what());
    }
}

json matrix_to_json(const Matrix2Df& m) {
    json rows = json::array();
    for (Eigen::Index r = 0; r < m.rows(); ++r) {
        json row = json::array();
        for (Eigen::Index c = 0; c < m.cols(); ++c) row.push_back(m(r, c));
        rows.push_back(row);
    }
    return rows;
}

Matrix2Df matrix_from_json(const json& j, const std::string& what) {
    if (!j.is_array() || j.empty() || !j[0].is_array() || j[0].empty()) {
        throw InvalidInputError(what + " must be a non-empty 2D array");
    }
    const size_t rows = j.size();
    const size_t cols = j[0].size();
    Matrix2Df m(static_cast<Eigen::Index>(rows), static_cast<Eigen::Index>(cols));
    for (size_t r = 0; r < rows; ++r) {
        if (!j[r].is_array() || j[r].size() != cols) {
            throw ShapeMismatchError(what + " has ragged rows");
        }
        for (size_t c = 0; c < cols; ++c) {
            const json& v = j[r][c];
            if (!v.is_number()) {
                throw InvalidInputError(what + " entry (" + std::to_string(r) + ", " +
                                        std::to_string(c) + ") is not a number");
            }
            m(static_cast<Eigen::Index>(r), static_cast<Eigen::Index>(c)) = v.get<float>();
        }
    }
    return m;
}

FilterBank filter_bank_from_json(const json& j) {
    if (!j.is_object() || !j.contains("filters") || !j["filters"].is_array() ||
        !j.contains("bias")) {
        throw InvalidInputError("model needs \"filters\" and \"bias\"");
    }
    std::vector<Matrix2Df> kernels;
    for (const auto& f : j["filters"]) {
        kernels.push_back(matrix_from_json(f, "filter"));
    }
    return FilterBank::from_spatial(kernels, matrix_from_json(j["bias"], "bias"));
}

FilterBank read_filter_bank(const fs::path& path) {
    return filter_bank_from_json(parse_file(path));
}

Matrix2Df read_matrix(const fs::path& path, const std::string& what) {
    return matrix_from_json(parse_file(path), what);
}

} // namespace ffcc::io

#pragma once

#include "ffcc/core/types.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

namespace ffcc::io {

namespace fs = std::filesystem;
using json = nlohmann::json;

json matrix_to_json(const Matrix2Df& m);

/**
 * Parses a non-empty rectangular array of numbers.
 * Throws InvalidInputError for non-arrays and non-numeric entries,
 * ShapeMismatchError for ragged rows. `what` names the value in messages.
 */
Matrix2Df matrix_from_json(const json& j, const std::string& what);

// Model document: {"filters": [raw n x n, edge n x n], "bias": n x n}, spatial domain.
FilterBank filter_bank_from_json(const json& j);

// Reads a model document. Unparseable files are IOError.
FilterBank read_filter_bank(const fs::path& path);

// Reads a bare n x n matrix document.
Matrix2Df read_matrix(const fs::path& path, const std::string& what);

} // namespace ffcc::io

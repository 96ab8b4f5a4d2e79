#pragma once

#include <map>
#include <string>
#include <vector>

#include "matchtrack/core/types.h"
#include "matchtrack/pipeline/match_analyzer.h"

namespace matchtrack {
namespace io {

// Записанный выход моделей плюс всё, что нужно MatchInput.
struct Dataset {
    pipeline::MatchInput input;
    std::map<int, std::vector<Detection>> players;
    std::map<int, Detection> ball;
};

// YAML / JSON через cv::FileStorage (формат по расширению).
// Не открылся или битая структура -> ValidationError (InvalidFormat / MissingField).
Dataset read_dataset(const std::string &path);

void write_result(const std::string &path, const pipeline::MatchOutput &out);

} // namespace io
} // namespace matchtrack

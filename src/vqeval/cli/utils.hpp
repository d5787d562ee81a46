#pragma once
#include "vqeval/core/Config.hpp"
#include "vqeval/core/Evaluator.hpp"
#include "vqeval/core/VideoSource.hpp"

#include <ostream>
#include <string>

/*
  Helpers shared by the CLI modes: option -> config mapping and
  the plain-text rendering of results and metadata.
*/

/* Parse "WxH" (e.g. 640x360) or "native" (0x0). Returns false on bad input. */
bool parse_size(const std::string& s, int& w, int& h);

/* Build an EvalConfig from --samples, --exhaustive, --size, --window, --threads.
   Throws std::invalid_argument for malformed or unusable values. */
vqeval::EvalConfig config_from_args(int argc, char** argv);

/* Print the two mean scores with their quality bands and the pair count. */
void print_result(std::ostream& os, const std::string& label,
                  const vqeval::EvaluationResult& r);

/* Print container metadata, one field per line. */
void print_info(std::ostream& os, const vqeval::SourceInfo& si);

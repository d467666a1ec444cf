#ifndef RESULT_FORMATTER_H
#define RESULT_FORMATTER_H

#include <string>
#include "../model/ElectionResult.h"

namespace nposim {

enum class OutputFormat {
    JSON = 0,
    HUMAN_READABLE = 1
};

/**
 * @brief Renders election results for output files and logs
 */
class ResultFormatter {
public:
    /**
     * @brief "json" or "human-readable" (case-insensitive)
     * @throws ValidationError (field "output_format")
     */
    static OutputFormat parseFormat(const std::string& name);

    static std::string format(const ElectionResult& result, OutputFormat outputFormat);

    /**
     * @brief Summary with the first validators, one per line
     */
    static std::string humanReadable(const ElectionResult& result);
};

} // namespace nposim

#endif // RESULT_FORMATTER_H

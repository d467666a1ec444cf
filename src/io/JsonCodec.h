#ifndef JSON_CODEC_H
#define JSON_CODEC_H

#include <string>
#include <json/json.h>
#include "../model/ElectionConfig.h"
#include "../model/ElectionData.h"
#include "../model/ElectionResult.h"

namespace nposim {

/**
 * @brief JSON mapping of datasets, configurations, overrides and results
 *
 * Field names are snake_case. Balances are written as decimal strings so that
 * amounts above 2^64 survive; readers accept strings or unsigned integers.
 * Absent optional fields are omitted, never written as null.
 *
 * Readers throw InvalidData for malformed structure and ValidationError for
 * well-formed but invalid values.
 */
class JsonCodec {
public:
    // ========================================================================
    // DATASET
    // ========================================================================

    static Json::Value toJson(const ElectionData& data);
    static ElectionData dataFromJson(const Json::Value& value);

    // ========================================================================
    // CONFIGURATION
    // ========================================================================

    static Json::Value toJson(const ElectionOverrides& overrides);
    static ElectionOverrides overridesFromJson(const Json::Value& value);

    static Json::Value toJson(const ElectionConfiguration& config);
    static ElectionConfiguration configFromJson(const Json::Value& value);

    // ========================================================================
    // RESULT
    // ========================================================================

    static Json::Value toJson(const ElectionResult& result);
    static ElectionResult resultFromJson(const Json::Value& value);

    // ========================================================================
    // TEXT AND FILES
    // ========================================================================

    /**
     * @throws InvalidData on syntax errors
     */
    static Json::Value parse(const std::string& text);
    static std::string write(const Json::Value& value);

    /**
     * @brief Load and validate a dataset file
     * @throws InvalidData if the file cannot be read or parsed
     * @throws ValidationError if the dataset is inconsistent
     */
    static ElectionData loadDataFile(const std::string& path);
    static void saveDataFile(const ElectionData& data, const std::string& path);
    static void writeResultFile(const ElectionResult& result, const std::string& path);

    static void writeTextFile(const std::string& text, const std::string& path);

private:
    static Balance readBalance(const Json::Value& value, const std::string& field);
    static const Json::Value& require(const Json::Value& object, const char* key, const std::string& context);
    static std::string readString(const Json::Value& object, const char* key, const std::string& context);
};

} // namespace nposim

#endif // JSON_CODEC_H

#pragma once
#include "AgentPolicies.h"
#include "ClassificationMetrics.h"
#include "DatasetProfiler.h"
#include "Evaluator.h"
#include "MemoryStore.h"

#include <json/json.h>
#include <string>

/**
 * JSON shapes of persisted artifacts and memory records.
 * Decoders throw Augur::DatasetException when a value has the wrong shape.
 */
namespace ArtifactJson {

Json::Value toJson(const DatasetProfile& profile);
Json::Value toJson(const ModelMetrics& metrics);
Json::Value toJson(const EvaluationPayload& payload);
Json::Value toJson(const Reflection& reflection);
Json::Value toJson(const MemoryRecord& record);
Json::Value toJson(const MemoryNote& note);
Json::Value planToJson(const Plan& plan);

ModelMetrics metricsFromJson(const Json::Value& value);
MemoryRecord memoryRecordFromJson(const Json::Value& value);
MemoryNote memoryNoteFromJson(const Json::Value& value);

std::string toString(const Json::Value& value);

/**
 * @throws Augur::IOException when the file cannot be written.
 */
void writeJsonFile(const std::string& path, const Json::Value& value);

/**
 * @throws Augur::IOException when the file cannot be opened.
 * @throws Augur::DatasetException when the content is not valid JSON.
 */
Json::Value readJsonFile(const std::string& path);

} // namespace ArtifactJson

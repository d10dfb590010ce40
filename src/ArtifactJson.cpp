#include "ArtifactJson.h"
#include "AugurExceptions.h"

#include <fstream>

namespace {
Json::Value stringArray(const std::vector<std::string>& values) {
    Json::Value out(Json::arrayValue);
    for (const auto& v : values) out.append(v);
    return out;
}

const Json::Value& requireMember(const Json::Value& obj, const char* key) {
    if (!obj.isObject() || !obj.isMember(key)) {
        throw Augur::DatasetException(std::string("JSON value is missing '") + key + "'");
    }
    return obj[key];
}

double requireNumber(const Json::Value& obj, const char* key) {
    const Json::Value& v = requireMember(obj, key);
    if (!v.isNumeric()) throw Augur::DatasetException(std::string("JSON member '") + key + "' is not a number");
    return v.asDouble();
}

std::string requireString(const Json::Value& obj, const char* key) {
    const Json::Value& v = requireMember(obj, key);
    if (!v.isString()) throw Augur::DatasetException(std::string("JSON member '") + key + "' is not a string");
    return v.asString();
}

size_t requireCount(const Json::Value& obj, const char* key) {
    const Json::Value& v = requireMember(obj, key);
    if (!v.isUInt64()) throw Augur::DatasetException(std::string("JSON member '") + key + "' is not a count");
    return static_cast<size_t>(v.asUInt64());
}

Json::Value shapeToJson(const DatasetShape& shape) {
    Json::Value out(Json::objectValue);
    out["rows"] = static_cast<Json::UInt64>(shape.rows);
    out["cols"] = static_cast<Json::UInt64>(shape.cols);
    return out;
}
} // namespace

namespace ArtifactJson {

Json::Value toJson(const DatasetProfile& profile) {
    Json::Value out(Json::objectValue);
    out["shape"] = shapeToJson(profile.shape);
    out["columns"] = stringArray(profile.columns);

    Json::Value missing(Json::objectValue);
    for (const auto& kv : profile.missingPct) missing[kv.first] = kv.second;
    out["missing_pct"] = missing;

    out["target"] = profile.target;
    out["target_dtype"] = profile.targetDtype;
    out["is_classification"] = profile.isClassification;

    Json::Value types(Json::objectValue);
    types["numeric"] = stringArray(profile.featureTypes.numeric);
    types["categorical"] = stringArray(profile.featureTypes.categorical);
    out["feature_types"] = types;

    Json::Value unique(Json::objectValue);
    for (const auto& kv : profile.uniqueByColumn) unique[kv.first] = static_cast<Json::UInt64>(kv.second);
    out["n_unique_by_col"] = unique;

    out["notes"] = stringArray(profile.notes);

    if (profile.classCounts) {
        Json::Value counts(Json::objectValue);
        for (const auto& kv : *profile.classCounts) counts[kv.first] = static_cast<Json::UInt64>(kv.second);
        out["class_counts"] = counts;
    } else {
        out["class_counts"] = Json::Value(Json::nullValue);
    }
    out["imbalance_ratio"] = profile.imbalanceRatio;
    return out;
}

Json::Value toJson(const ModelMetrics& metrics) {
    Json::Value out(Json::objectValue);
    out["model"] = metrics.model;
    out["accuracy"] = metrics.accuracy;
    out["balanced_accuracy"] = metrics.balancedAccuracy;
    out["f1_macro"] = metrics.f1Macro;
    out["precision_macro"] = metrics.precisionMacro;
    out["recall_macro"] = metrics.recallMacro;
    return out;
}

Json::Value toJson(const EvaluationPayload& payload) {
    Json::Value out(Json::objectValue);
    out["best_metrics"] = toJson(payload.bestMetrics);
    Json::Value all(Json::arrayValue);
    for (const auto& m : payload.allMetrics) all.append(toJson(m));
    out["all_metrics"] = all;
    out["confusion_matrix_path"] = payload.confusionMatrixPath;

    Json::Value cm(Json::objectValue);
    cm["labels"] = stringArray(payload.confusion.labels);
    Json::Value rows(Json::arrayValue);
    for (const auto& row : payload.confusion.counts) {
        Json::Value r(Json::arrayValue);
        for (size_t v : row) r.append(static_cast<Json::UInt64>(v));
        rows.append(r);
    }
    cm["counts"] = rows;
    out["confusion_matrix"] = cm;

    out["classification_report"] = payload.classificationReport;
    return out;
}

Json::Value toJson(const Reflection& reflection) {
    Json::Value out(Json::objectValue);
    out["status"] = reflection.status;
    out["best_model"] = reflection.bestModel;
    out["issues"] = stringArray(reflection.issues);
    out["suggestions"] = stringArray(reflection.suggestions);
    out["replan_recommended"] = reflection.replanRecommended;
    return out;
}

Json::Value toJson(const MemoryRecord& record) {
    Json::Value out(Json::objectValue);
    out["last_seen"] = record.lastSeen;
    out["target"] = record.target;
    out["shape"] = shapeToJson(record.shape);
    out["best_model"] = record.bestModel;
    out["best_metrics"] = toJson(record.bestMetrics);
    return out;
}

Json::Value toJson(const MemoryNote& note) {
    Json::Value out(Json::objectValue);
    out["ts"] = note.ts;
    out["msg"] = note.msg;
    return out;
}

Json::Value planToJson(const Plan& plan) {
    Json::Value out(Json::objectValue);
    out["plan"] = stringArray(plan);
    return out;
}

ModelMetrics metricsFromJson(const Json::Value& value) {
    ModelMetrics m;
    m.model = requireString(value, "model");
    m.accuracy = requireNumber(value, "accuracy");
    m.balancedAccuracy = requireNumber(value, "balanced_accuracy");
    m.f1Macro = requireNumber(value, "f1_macro");
    m.precisionMacro = requireNumber(value, "precision_macro");
    m.recallMacro = requireNumber(value, "recall_macro");
    return m;
}

MemoryRecord memoryRecordFromJson(const Json::Value& value) {
    if (!value.isObject()) throw Augur::DatasetException("Memory record is not an object");
    MemoryRecord r;
    r.lastSeen = requireString(value, "last_seen");
    r.target = requireString(value, "target");
    const Json::Value& shape = requireMember(value, "shape");
    r.shape.rows = requireCount(shape, "rows");
    r.shape.cols = requireCount(shape, "cols");
    r.bestModel = requireString(value, "best_model");
    r.bestMetrics = metricsFromJson(requireMember(value, "best_metrics"));
    return r;
}

MemoryNote memoryNoteFromJson(const Json::Value& value) {
    MemoryNote note;
    note.ts = requireString(value, "ts");
    note.msg = requireString(value, "msg");
    return note;
}

std::string toString(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return Json::writeString(builder, value);
}

void writeJsonFile(const std::string& path, const Json::Value& value) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) throw Augur::IOException("Cannot open for writing: " + path);
    out << toString(value) << "\n";
    out.flush();
    if (!out.good()) throw Augur::IOException("Failed while writing: " + path);
}

Json::Value readJsonFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw Augur::IOException("Cannot open for reading: " + path);

    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    Json::Value root;
    std::string errors;
    if (!Json::parseFromStream(builder, in, &root, &errors)) {
        throw Augur::DatasetException("Invalid JSON in " + path + ": " + errors);
    }
    return root;
}

} // namespace ArtifactJson

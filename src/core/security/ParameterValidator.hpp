#pragma once

#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QVariant>

#include "core/common/Expected.hpp"
#include "core/plugin/PluginTypes.hpp"

namespace Corral {

struct ValidationError {
    QString parameter; // dotted / indexed path, empty for request-level errors
    QString message;
};

// Rule form: name -> {type, required, default, min, max, min_length,
// max_length, pattern, enum, items, properties, allow_additional_properties}
struct ParameterSchema {
    QVariantMap rules;
    bool allowAdditional = true;

    bool isEmpty() const { return rules.isEmpty(); }

    // Reads "parameters" or, when absent, a JSON-Schema style "input_schema".
    static ParameterSchema fromManifest(const PluginManifest& manifest);
    static QVariantMap normalizeRule(const QVariantMap& node);
};

struct SanitizedOutput {
    QVariant value;
    bool truncated = false;
};

class ParameterValidator {
public:
    static constexpr qint64 MAX_PARAMETER_BYTES = 1024 * 1024;
    static const QString TRUNCATION_MARKER;

    static Expected<QVariantMap, ValidationError> sanitizeInput(const QVariantMap& params,
                                                                const ParameterSchema& schema);

    // Caps the plugin result at limits.maxOutputBytes(). Strings and
    // non-serializable values are truncated, anything else over budget fails.
    static Expected<SanitizedOutput, PluginFault> sanitizeOutput(const QVariant& result,
                                                                 const ResourceLimits& limits);

    static Expected<QVariant, ValidationError> coerce(const QVariant& value,
                                                      const QString& type,
                                                      const QString& name);

    static bool isJsonSerializable(const QVariant& value);
    static qint64 serializedSize(const QVariant& value);
    static QString truncateUtf8(const QString& text, qint64 maxBytes);
    static QString debugRepresentation(const QVariant& value);

private:
    static Expected<QVariant, ValidationError> validateValue(const QVariant& value,
                                                             const QVariantMap& rule,
                                                             const QString& name);
    static Expected<QVariantMap, ValidationError> validateObject(const QVariantMap& value,
                                                                 const QVariantMap& properties,
                                                                 bool allowAdditional,
                                                                 const QString& prefix);
    static Expected<void, ValidationError> checkLength(const QVariant& value, const QVariantMap& rule,
                                                       const QString& name);
    static Expected<void, ValidationError> checkRange(const QVariant& value, const QVariantMap& rule,
                                                      const QString& name);
    static Expected<void, ValidationError> checkPattern(const QVariant& value, const QVariantMap& rule,
                                                        const QString& name);
    static Expected<void, ValidationError> checkEnum(const QVariant& value, const QVariantMap& rule,
                                                     const QString& name);

    static QString canonicalType(const QString& type);
    static bool isIntegral(const QVariant& value);
    static bool isNumber(const QVariant& value);
    static bool valuesEqual(const QVariant& lhs, const QVariant& rhs);
    static QString fitStringToBudget(const QString& text, qint64 budget);
};

} // namespace Corral

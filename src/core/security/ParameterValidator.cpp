#include "ParameterValidator.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QDebug>
#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonValue>
#include <QtCore/QRegularExpression>
#include <QtCore/QSet>
#include <QtCore/QtNumeric>
#include <cmath>

namespace Corral {

const QString ParameterValidator::TRUNCATION_MARKER = QStringLiteral("...[truncated]");

namespace {

ValidationError makeError(const QString& parameter, const QString& message) {
    return ValidationError{parameter, message};
}

ValidationError typeError(const QString& name, const QString& type) {
    return makeError(name, QStringLiteral("Parameter '%1' must be of type %2").arg(name, type));
}

bool isAbsent(const QVariant& value) {
    return !value.isValid() || value.metaType().id() == QMetaType::Nullptr;
}

QString joinForMessage(const QVariantList& values) {
    QStringList parts;
    for (const QVariant& value : values) {
        parts.append(value.toString());
    }
    return parts.join(", ");
}

} // namespace

ParameterSchema ParameterSchema::fromManifest(const PluginManifest& manifest) {
    ParameterSchema schema;
    const QVariantMap& extensions = manifest.extensions;

    if (extensions.contains("parameters")) {
        const QVariantMap declared = extensions.value("parameters").toMap();
        for (auto it = declared.constBegin(); it != declared.constEnd(); ++it) {
            schema.rules.insert(it.key(), normalizeRule(it.value().toMap()));
        }
        schema.allowAdditional = extensions.value("allow_additional_parameters", true).toBool();
        return schema;
    }

    if (extensions.contains("input_schema")) {
        const QVariantMap normalized = normalizeRule(extensions.value("input_schema").toMap());
        schema.rules = normalized.value("properties").toMap();
        schema.allowAdditional = extensions.contains("allow_additional_parameters")
            ? extensions.value("allow_additional_parameters").toBool()
            : normalized.value("allow_additional_properties", true).toBool();
    }
    return schema;
}

QVariantMap ParameterSchema::normalizeRule(const QVariantMap& node) {
    static const QList<QPair<QString, QString>> aliases = {
        {"minimum", "min"},
        {"maximum", "max"},
        {"minLength", "min_length"},
        {"maxLength", "max_length"},
        {"minItems", "min_length"},
        {"maxItems", "max_length"},
        {"additionalProperties", "allow_additional_properties"}
    };

    QVariantMap rule = node;
    for (const auto& alias : aliases) {
        if (rule.contains(alias.first) && !rule.contains(alias.second)) {
            rule.insert(alias.second, rule.value(alias.first));
        }
        rule.remove(alias.first);
    }

    if (rule.contains("items")) {
        rule.insert("items", normalizeRule(rule.value("items").toMap()));
    }

    if (rule.contains("properties")) {
        // JSON-Schema lists required property names on the parent
        QSet<QString> requiredNames;
        if (rule.value("required").metaType().id() != QMetaType::Bool) {
            for (const QString& name : rule.value("required").toStringList()) {
                requiredNames.insert(name);
            }
            rule.remove("required");
        }

        QVariantMap properties;
        const QVariantMap declared = rule.value("properties").toMap();
        for (auto it = declared.constBegin(); it != declared.constEnd(); ++it) {
            QVariantMap child = normalizeRule(it.value().toMap());
            if (requiredNames.contains(it.key())) {
                child.insert("required", true);
            }
            properties.insert(it.key(), child);
        }
        rule.insert("properties", properties);
    }
    return rule;
}

Expected<QVariantMap, ValidationError> ParameterValidator::sanitizeInput(const QVariantMap& params,
                                                                         const ParameterSchema& schema) {
    const qint64 size = serializedSize(QVariant(params));
    if (size > MAX_PARAMETER_BYTES) {
        CORRAL_WARN("Rejecting parameters of {} bytes", size);
        return makeUnexpected(makeError(QString(),
            QStringLiteral("Parameters exceed maximum size of %1 bytes (got %2)")
                .arg(MAX_PARAMETER_BYTES).arg(size)));
    }

    return validateObject(params, schema.rules, schema.allowAdditional, QString());
}

Expected<QVariantMap, ValidationError> ParameterValidator::validateObject(const QVariantMap& value,
                                                                          const QVariantMap& properties,
                                                                          bool allowAdditional,
                                                                          const QString& prefix) {
    QVariantMap sanitized;

    for (auto it = properties.constBegin(); it != properties.constEnd(); ++it) {
        const QString& key = it.key();
        const QVariantMap rule = it.value().toMap();
        const QString name = prefix.isEmpty() ? key : prefix + "." + key;
        const QVariant provided = value.value(key);

        if (isAbsent(provided)) {
            if (rule.contains("default")) {
                auto validated = validateValue(rule.value("default"), rule, name);
                if (!validated) {
                    return makeUnexpected(validated.error());
                }
                sanitized.insert(key, validated.value());
            } else if (rule.value("required", false).toBool()) {
                return makeUnexpected(makeError(name, QStringLiteral("Missing required parameter: %1").arg(name)));
            }
            continue;
        }

        auto validated = validateValue(provided, rule, name);
        if (!validated) {
            return makeUnexpected(validated.error());
        }
        sanitized.insert(key, validated.value());
    }

    QStringList unexpected;
    for (auto it = value.constBegin(); it != value.constEnd(); ++it) {
        if (!properties.contains(it.key())) {
            unexpected.append(it.key());
        }
    }

    if (!unexpected.isEmpty()) {
        if (!allowAdditional) {
            if (prefix.isEmpty()) {
                return makeUnexpected(makeError(unexpected.first(),
                    QStringLiteral("Unexpected parameters: %1").arg(unexpected.join(", "))));
            }
            return makeUnexpected(makeError(prefix,
                QStringLiteral("Unexpected properties in '%1': %2").arg(prefix, unexpected.join(", "))));
        }
        for (const QString& key : unexpected) {
            sanitized.insert(key, value.value(key));
        }
    }

    return sanitized;
}

Expected<QVariant, ValidationError> ParameterValidator::validateValue(const QVariant& value,
                                                                      const QVariantMap& rule,
                                                                      const QString& name) {
    QVariant current = value;

    const QString type = rule.value("type").toString();
    if (!type.isEmpty()) {
        auto coerced = coerce(current, type, name);
        if (!coerced) {
            return makeUnexpected(coerced.error());
        }
        current = coerced.value();
    }

    auto lengthCheck = checkLength(current, rule, name);
    if (!lengthCheck) {
        return makeUnexpected(lengthCheck.error());
    }
    auto rangeCheck = checkRange(current, rule, name);
    if (!rangeCheck) {
        return makeUnexpected(rangeCheck.error());
    }
    auto patternCheck = checkPattern(current, rule, name);
    if (!patternCheck) {
        return makeUnexpected(patternCheck.error());
    }
    auto enumCheck = checkEnum(current, rule, name);
    if (!enumCheck) {
        return makeUnexpected(enumCheck.error());
    }

    const int id = current.metaType().id();

    if (id == QMetaType::QVariantList && rule.contains("items")) {
        const QVariantMap itemRule = rule.value("items").toMap();
        QVariantList items = current.toList();
        for (int i = 0; i < items.size(); ++i) {
            auto item = validateValue(items.at(i), itemRule, QStringLiteral("%1[%2]").arg(name).arg(i));
            if (!item) {
                return makeUnexpected(item.error());
            }
            items[i] = item.value();
        }
        current = items;
    }

    if (id == QMetaType::QVariantMap && rule.contains("properties")) {
        auto object = validateObject(current.toMap(),
                                     rule.value("properties").toMap(),
                                     rule.value("allow_additional_properties", true).toBool(),
                                     name);
        if (!object) {
            return makeUnexpected(object.error());
        }
        current = object.value();
    }

    return current;
}

Expected<QVariant, ValidationError> ParameterValidator::coerce(const QVariant& value,
                                                               const QString& type,
                                                               const QString& name) {
    const QString canonical = canonicalType(type);
    const int id = value.metaType().id();

    if (canonical.isEmpty()) {
        return value;
    }

    if (canonical == "integer") {
        if (id == QMetaType::Bool) {
            return makeUnexpected(typeError(name, canonical));
        }
        if (isIntegral(value)) {
            return value;
        }
        double number = 0.0;
        bool ok = false;
        if (id == QMetaType::Double || id == QMetaType::Float) {
            number = value.toDouble();
            ok = true;
        } else if (id == QMetaType::QString) {
            const QString text = value.toString().trimmed();
            const qlonglong integer = text.toLongLong(&ok);
            if (ok) {
                return QVariant(integer);
            }
            number = text.toDouble(&ok);
        }
        if (ok && qIsFinite(number) && std::floor(number) == number && std::fabs(number) < 9.0e18) {
            return QVariant(static_cast<qlonglong>(number));
        }
        return makeUnexpected(typeError(name, canonical));
    }

    if (canonical == "float") {
        if (id == QMetaType::Double || id == QMetaType::Float) {
            return value;
        }
        if (isIntegral(value)) {
            return QVariant(value.toDouble());
        }
        if (id == QMetaType::QString) {
            bool ok = false;
            const double number = value.toString().trimmed().toDouble(&ok);
            if (ok && qIsFinite(number)) {
                return QVariant(number);
            }
        }
        return makeUnexpected(typeError(name, canonical));
    }

    if (canonical == "boolean") {
        if (id == QMetaType::Bool) {
            return value;
        }
        if (isIntegral(value)) {
            const qlonglong number = value.toLongLong();
            if (number == 0 || number == 1) {
                return QVariant(number == 1);
            }
        } else if (id == QMetaType::QString) {
            static const QStringList truthy = {"true", "yes", "on", "1"};
            static const QStringList falsy = {"false", "no", "off", "0"};
            const QString text = value.toString().trimmed().toLower();
            if (truthy.contains(text)) {
                return QVariant(true);
            }
            if (falsy.contains(text)) {
                return QVariant(false);
            }
        }
        return makeUnexpected(typeError(name, canonical));
    }

    if (canonical == "string") {
        if (id == QMetaType::QString) {
            return value;
        }
        if (id == QMetaType::Bool) {
            return QVariant(value.toBool() ? QStringLiteral("true") : QStringLiteral("false"));
        }
        if (isNumber(value)) {
            return QVariant(value.toString());
        }
        if (id == QMetaType::QByteArray) {
            return QVariant(QString::fromUtf8(value.toByteArray()));
        }
        return makeUnexpected(typeError(name, canonical));
    }

    if (canonical == "array") {
        if (id == QMetaType::QVariantList) {
            return value;
        }
        if (id == QMetaType::QStringList) {
            return QVariant(value.toList());
        }
        return makeUnexpected(typeError(name, canonical));
    }

    if (canonical == "object") {
        if (id == QMetaType::QVariantMap) {
            return value;
        }
        if (id == QMetaType::QVariantHash) {
            QVariantMap map;
            const QVariantHash hash = value.toHash();
            for (auto it = hash.constBegin(); it != hash.constEnd(); ++it) {
                map.insert(it.key(), it.value());
            }
            return QVariant(map);
        }
        return makeUnexpected(typeError(name, canonical));
    }

    return makeUnexpected(makeError(name,
        QStringLiteral("Unsupported type '%1' declared for parameter '%2'").arg(type, name)));
}

Expected<void, ValidationError> ParameterValidator::checkLength(const QVariant& value,
                                                                const QVariantMap& rule,
                                                                const QString& name) {
    if (!rule.contains("min_length") && !rule.contains("max_length")) {
        return {};
    }

    qint64 length = -1;
    switch (value.metaType().id()) {
        case QMetaType::QString: length = value.toString().toUcs4().size(); break;
        case QMetaType::QVariantList: length = value.toList().size(); break;
        case QMetaType::QStringList: length = value.toStringList().size(); break;
        case QMetaType::QVariantMap: length = value.toMap().size(); break;
        default: return {};
    }

    if (rule.contains("min_length") && length < rule.value("min_length").toLongLong()) {
        return makeUnexpected(makeError(name, QStringLiteral("Parameter '%1' must have length >= %2")
                                                  .arg(name, rule.value("min_length").toString())));
    }
    if (rule.contains("max_length") && length > rule.value("max_length").toLongLong()) {
        return makeUnexpected(makeError(name, QStringLiteral("Parameter '%1' must have length <= %2")
                                                  .arg(name, rule.value("max_length").toString())));
    }
    return {};
}

Expected<void, ValidationError> ParameterValidator::checkRange(const QVariant& value,
                                                               const QVariantMap& rule,
                                                               const QString& name) {
    if (!isNumber(value) || value.metaType().id() == QMetaType::Bool) {
        return {};
    }

    const double number = value.toDouble();
    if (rule.contains("min") && number < rule.value("min").toDouble()) {
        return makeUnexpected(makeError(name, QStringLiteral("Parameter '%1' must be >= %2")
                                                  .arg(name, rule.value("min").toString())));
    }
    if (rule.contains("max") && number > rule.value("max").toDouble()) {
        return makeUnexpected(makeError(name, QStringLiteral("Parameter '%1' must be <= %2")
                                                  .arg(name, rule.value("max").toString())));
    }
    return {};
}

Expected<void, ValidationError> ParameterValidator::checkPattern(const QVariant& value,
                                                                 const QVariantMap& rule,
                                                                 const QString& name) {
    const QString pattern = rule.value("pattern").toString();
    if (pattern.isEmpty() || value.metaType().id() != QMetaType::QString) {
        return {};
    }

    const QRegularExpression expression(pattern);
    if (!expression.isValid()) {
        CORRAL_WARN("Invalid pattern '{}' declared for parameter {}: {}",
                    pattern.toStdString(), name.toStdString(), expression.errorString().toStdString());
        return makeUnexpected(makeError(name, QStringLiteral("Invalid pattern declared for parameter '%1'").arg(name)));
    }

    const auto match = expression.match(value.toString(), 0, QRegularExpression::NormalMatch,
                                        QRegularExpression::AnchorAtOffsetMatchOption);
    if (!match.hasMatch()) {
        return makeUnexpected(makeError(name, QStringLiteral("Parameter '%1' does not match pattern %2")
                                                  .arg(name, pattern)));
    }
    return {};
}

Expected<void, ValidationError> ParameterValidator::checkEnum(const QVariant& value,
                                                              const QVariantMap& rule,
                                                              const QString& name) {
    if (!rule.contains("enum")) {
        return {};
    }

    const QVariantList allowed = rule.value("enum").toList();
    for (const QVariant& candidate : allowed) {
        if (valuesEqual(value, candidate)) {
            return {};
        }
    }
    return makeUnexpected(makeError(name, QStringLiteral("Parameter '%1' must be one of: %2")
                                              .arg(name, joinForMessage(allowed))));
}

Expected<SanitizedOutput, PluginFault> ParameterValidator::sanitizeOutput(const QVariant& result,
                                                                          const ResourceLimits& limits) {
    const qint64 budget = limits.maxOutputBytes();

    if (!isJsonSerializable(result)) {
        const QString representation = debugRepresentation(result);
        const QString fitted = fitStringToBudget(representation, budget);
        CORRAL_WARN("Plugin result of type {} is not serializable, returning its debug form",
                    result.typeName() ? result.typeName() : "unknown");
        return SanitizedOutput{fitted, fitted != representation};
    }

    const qint64 size = serializedSize(result);
    if (size <= budget) {
        return SanitizedOutput{result, false};
    }

    if (result.metaType().id() == QMetaType::QString) {
        CORRAL_DEBUG("Truncating {} byte string result to {} bytes", size, budget);
        return SanitizedOutput{fitStringToBudget(result.toString(), budget), true};
    }

    PluginFault fault;
    fault.kind = PluginError::OutputTooLarge;
    fault.message = QStringLiteral("Output too large: %1 bytes exceeds the limit of %2 bytes")
                        .arg(size).arg(budget);
    return makeUnexpected(fault);
}

bool ParameterValidator::isJsonSerializable(const QVariant& value) {
    if (isAbsent(value)) {
        return true;
    }

    switch (value.metaType().id()) {
        case QMetaType::Bool:
        case QMetaType::QString:
        case QMetaType::QStringList:
        case QMetaType::QJsonValue:
        case QMetaType::QJsonObject:
        case QMetaType::QJsonArray:
        case QMetaType::QJsonDocument:
            return true;
        case QMetaType::Double:
        case QMetaType::Float:
            return qIsFinite(value.toDouble());
        case QMetaType::QVariantList: {
            const QVariantList list = value.toList();
            for (const QVariant& item : list) {
                if (!isJsonSerializable(item)) return false;
            }
            return true;
        }
        case QMetaType::QVariantMap: {
            const QVariantMap map = value.toMap();
            for (auto it = map.constBegin(); it != map.constEnd(); ++it) {
                if (!isJsonSerializable(it.value())) return false;
            }
            return true;
        }
        case QMetaType::QVariantHash: {
            const QVariantHash hash = value.toHash();
            for (auto it = hash.constBegin(); it != hash.constEnd(); ++it) {
                if (!isJsonSerializable(it.value())) return false;
            }
            return true;
        }
        default:
            return isIntegral(value);
    }
}

qint64 ParameterValidator::serializedSize(const QVariant& value) {
    // Wrap in an array so scalars serialize too, then drop the brackets
    QJsonArray wrapper;
    wrapper.append(QJsonValue::fromVariant(value));
    return QJsonDocument(wrapper).toJson(QJsonDocument::Compact).size() - 2;
}

QString ParameterValidator::truncateUtf8(const QString& text, qint64 maxBytes) {
    const QByteArray utf8 = text.toUtf8();
    if (utf8.size() <= maxBytes) {
        return text;
    }

    const QByteArray marker = TRUNCATION_MARKER.toUtf8();
    if (maxBytes <= marker.size()) {
        return QString::fromUtf8(marker.left(qMax<qint64>(maxBytes, 0)));
    }

    qint64 cut = maxBytes - marker.size();
    // Back off to the start of a code point
    while (cut > 0 && (static_cast<unsigned char>(utf8.at(cut)) & 0xC0) == 0x80) {
        --cut;
    }
    return QString::fromUtf8(utf8.left(cut)) + TRUNCATION_MARKER;
}

QString ParameterValidator::fitStringToBudget(const QString& text, qint64 budget) {
    qint64 size = serializedSize(QVariant(text));
    if (size <= budget) {
        return text;
    }

    // Quotes and escapes count against the budget
    qint64 limit = budget - 2;
    QString candidate = truncateUtf8(text, limit);
    size = serializedSize(QVariant(candidate));
    while (size > budget && limit > 0) {
        limit -= qMax<qint64>(size - budget, 1);
        candidate = truncateUtf8(text, limit);
        size = serializedSize(QVariant(candidate));
    }
    return limit > 0 ? candidate : QString();
}

QString ParameterValidator::debugRepresentation(const QVariant& value) {
    QString text;
    QDebug stream(&text);
    stream.nospace().noquote() << value;
    return text;
}

QString ParameterValidator::canonicalType(const QString& type) {
    const QString lowered = type.trimmed().toLower();
    if (lowered == "str") return "string";
    if (lowered == "int") return "integer";
    if (lowered == "number" || lowered == "double") return "float";
    if (lowered == "bool") return "boolean";
    if (lowered == "list") return "array";
    if (lowered == "dict" || lowered == "map") return "object";
    return lowered;
}

bool ParameterValidator::isIntegral(const QVariant& value) {
    switch (value.metaType().id()) {
        case QMetaType::Int:
        case QMetaType::UInt:
        case QMetaType::LongLong:
        case QMetaType::ULongLong:
        case QMetaType::Long:
        case QMetaType::ULong:
        case QMetaType::Short:
        case QMetaType::UShort:
            return true;
        default:
            return false;
    }
}

bool ParameterValidator::isNumber(const QVariant& value) {
    const int id = value.metaType().id();
    return isIntegral(value) || id == QMetaType::Double || id == QMetaType::Float;
}

bool ParameterValidator::valuesEqual(const QVariant& lhs, const QVariant& rhs) {
    if (isNumber(lhs) && isNumber(rhs)) {
        return lhs.toDouble() == rhs.toDouble();
    }
    if (lhs.metaType().id() == QMetaType::QString && rhs.metaType().id() == QMetaType::QString) {
        return lhs.toString() == rhs.toString();
    }
    return lhs == rhs;
}

} // namespace Corral

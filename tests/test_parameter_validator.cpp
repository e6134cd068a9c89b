#include <QtTest/QtTest>
#include <QtCore/QPoint>

#include "utils/TestUtils.hpp"
#include "../src/core/security/ParameterValidator.hpp"

using namespace Corral;
using namespace Corral::Test;

class TestParameterValidator : public QObject {
    Q_OBJECT

private slots:
    void testMissingRequiredParameter();
    void testDefaultsAreAppliedAndValidated();
    void testIntegerCoercion();
    void testBooleanCoercion();
    void testStringAndFloatCoercion();
    void testCoercionIsIdempotent();
    void testLengthRangePatternEnum();
    void testStringLengthCountsCodePoints();
    void testRulesAreCheckedInKeyOrder();
    void testPatternIsAnchoredAtStart();
    void testArrayItemsAreNamedByIndex();
    void testUnexpectedTopLevelParameters();
    void testNestedAdditionalPropertiesPrecedence();
    void testInputSchemaIsNormalized();
    void testParameterSizeGuard();
    void testOutputWithinBudget();
    void testOversizedStringIsTruncated();
    void testOversizedObjectFails();
    void testNonSerializableOutputFallsBackToDebugText();

private:
    static ParameterSchema schemaOf(const QVariantMap& rules, bool allowAdditional = true) {
        ParameterSchema schema;
        schema.rules = rules;
        schema.allowAdditional = allowAdditional;
        return schema;
    }
};

void TestParameterValidator::testMissingRequiredParameter() {
    auto schema = schemaOf({{"text", QVariantMap{{"type", "string"}, {"required", true}}}});

    auto result = ParameterValidator::sanitizeInput(QVariantMap(), schema);
    QVERIFY(result.hasError());
    QCOMPARE(result.error().parameter, QString("text"));
    QCOMPARE(result.error().message, QString("Missing required parameter: text"));

    // Null counts as absent
    result = ParameterValidator::sanitizeInput({{"text", QVariant::fromValue(nullptr)}}, schema);
    QVERIFY(result.hasError());
    QVERIFY(result.error().message.contains("text"));
}

void TestParameterValidator::testDefaultsAreAppliedAndValidated() {
    auto schema = schemaOf({
        {"count", QVariantMap{{"type", "integer"}, {"default", "5"}}},
        {"mode", QVariantMap{{"type", "string"}, {"default", "fast"}, {"enum", QVariantList{"fast", "slow"}}}}
    });

    auto result = ParameterValidator::sanitizeInput(QVariantMap(), schema);
    ASSERT_EXPECTED_VALUE(result);
    QCOMPARE(result.value().value("count").toLongLong(), 5LL);
    QCOMPARE(result.value().value("mode").toString(), QString("fast"));

    auto badDefault = schemaOf({{"mode", QVariantMap{{"default", "medium"}, {"enum", QVariantList{"fast", "slow"}}}}});
    auto rejected = ParameterValidator::sanitizeInput(QVariantMap(), badDefault);
    QVERIFY(rejected.hasError());
    QVERIFY(rejected.error().message.contains("must be one of"));
}

void TestParameterValidator::testIntegerCoercion() {
    auto coerced = ParameterValidator::coerce(QString("42"), "integer", "n");
    ASSERT_EXPECTED_VALUE(coerced);
    QCOMPARE(coerced.value().toLongLong(), 42LL);

    coerced = ParameterValidator::coerce(7.0, "int", "n");
    ASSERT_EXPECTED_VALUE(coerced);
    QCOMPARE(coerced.value().toLongLong(), 7LL);

    auto fractional = ParameterValidator::coerce(7.5, "integer", "n");
    QVERIFY(fractional.hasError());
    QCOMPARE(fractional.error().message, QString("Parameter 'n' must be of type integer"));

    QVERIFY(ParameterValidator::coerce(true, "integer", "n").hasError());
    QVERIFY(ParameterValidator::coerce(QString("abc"), "integer", "n").hasError());
}

void TestParameterValidator::testBooleanCoercion() {
    const QStringList truthy = {"true", "YES", "On", "1"};
    for (const QString& text : truthy) {
        auto coerced = ParameterValidator::coerce(text, "boolean", "flag");
        ASSERT_EXPECTED_VALUE(coerced);
        QCOMPARE(coerced.value().toBool(), true);
    }

    const QStringList falsy = {"false", "no", "OFF", "0"};
    for (const QString& text : falsy) {
        auto coerced = ParameterValidator::coerce(text, "bool", "flag");
        ASSERT_EXPECTED_VALUE(coerced);
        QCOMPARE(coerced.value().toBool(), false);
    }

    auto fromInteger = ParameterValidator::coerce(1, "boolean", "flag");
    ASSERT_EXPECTED_VALUE(fromInteger);
    QCOMPARE(fromInteger.value().metaType().id(), int(QMetaType::Bool));

    QVERIFY(ParameterValidator::coerce(QString("maybe"), "boolean", "flag").hasError());
    QVERIFY(ParameterValidator::coerce(2, "boolean", "flag").hasError());
}

void TestParameterValidator::testStringAndFloatCoercion() {
    auto fromNumber = ParameterValidator::coerce(12, "string", "s");
    ASSERT_EXPECTED_VALUE(fromNumber);
    QCOMPARE(fromNumber.value().toString(), QString("12"));

    auto fromBool = ParameterValidator::coerce(false, "str", "s");
    ASSERT_EXPECTED_VALUE(fromBool);
    QCOMPARE(fromBool.value().toString(), QString("false"));

    QVERIFY(ParameterValidator::coerce(QVariantList{1, 2}, "string", "s").hasError());

    auto fromText = ParameterValidator::coerce(QString("2.5"), "float", "x");
    ASSERT_EXPECTED_VALUE(fromText);
    QCOMPARE(fromText.value().toDouble(), 2.5);

    QVERIFY(ParameterValidator::coerce(true, "number", "x").hasError());
    QVERIFY(ParameterValidator::coerce(QVariantMap(), "array", "x").hasError());
    QVERIFY(ParameterValidator::coerce(QVariantList(), "dict", "x").hasError());
}

void TestParameterValidator::testCoercionIsIdempotent() {
    const QList<QPair<QVariant, QString>> cases = {
        {QVariant(qlonglong(3)), "integer"},
        {QVariant(1.25), "float"},
        {QVariant(true), "boolean"},
        {QVariant(QString("hello")), "string"},
        {QVariant(QVariantList{1, "two"}), "array"},
        {QVariant(QVariantMap{{"k", 1}}), "object"},
    };

    for (const auto& testCase : cases) {
        auto once = ParameterValidator::coerce(testCase.first, testCase.second, "p");
        ASSERT_EXPECTED_VALUE(once);
        QCOMPARE(once.value(), testCase.first);

        auto twice = ParameterValidator::coerce(once.value(), testCase.second, "p");
        ASSERT_EXPECTED_VALUE(twice);
        QCOMPARE(twice.value(), once.value());
    }
}

void TestParameterValidator::testLengthRangePatternEnum() {
    auto schema = schemaOf({
        {"name", QVariantMap{{"type", "string"}, {"min_length", 2}, {"max_length", 5}}},
        {"age", QVariantMap{{"type", "integer"}, {"min", 0}, {"max", 150}}},
        {"code", QVariantMap{{"type", "string"}, {"pattern", "[A-Z]{3}"}}},
        {"color", QVariantMap{{"enum", QVariantList{"red", "green"}}}}
    });

    auto ok = ParameterValidator::sanitizeInput({{"name", "bob"}, {"age", "30"}, {"code", "ABC"}, {"color", "red"}},
                                                schema);
    ASSERT_EXPECTED_VALUE(ok);
    QCOMPARE(ok.value().value("age").toLongLong(), 30LL);

    auto tooShort = ParameterValidator::sanitizeInput({{"name", "b"}}, schema);
    QVERIFY(tooShort.hasError());
    QCOMPARE(tooShort.error().message, QString("Parameter 'name' must have length >= 2"));

    auto tooLong = ParameterValidator::sanitizeInput({{"name", "bobbybob"}}, schema);
    QVERIFY(tooLong.hasError());
    QCOMPARE(tooLong.error().message, QString("Parameter 'name' must have length <= 5"));

    auto tooOld = ParameterValidator::sanitizeInput({{"age", 200}}, schema);
    QVERIFY(tooOld.hasError());
    QCOMPARE(tooOld.error().message, QString("Parameter 'age' must be <= 150"));

    auto negative = ParameterValidator::sanitizeInput({{"age", -1}}, schema);
    QVERIFY(negative.hasError());
    QCOMPARE(negative.error().message, QString("Parameter 'age' must be >= 0"));

    auto badCode = ParameterValidator::sanitizeInput({{"code", "abc"}}, schema);
    QVERIFY(badCode.hasError());
    QVERIFY(badCode.error().message.contains("does not match pattern"));

    auto badColor = ParameterValidator::sanitizeInput({{"color", "blue"}}, schema);
    QVERIFY(badColor.hasError());
    QCOMPARE(badColor.error().message, QString("Parameter 'color' must be one of: red, green"));
}

void TestParameterValidator::testStringLengthCountsCodePoints() {
    auto schema = schemaOf({{"emoji", QVariantMap{{"type", "string"}, {"min_length", 2}, {"max_length", 2}}}});

    // U+1F600 is one character but two UTF-16 units
    const char32_t twoFaces[] = {0x1F600, 0x1F600};
    const char32_t threeFaces[] = {0x1F600, 0x1F600, 0x1F600};
    const char32_t oneFace[] = {0x1F600};

    const QString two = QString::fromUcs4(twoFaces, 2);
    QCOMPARE(two.length(), qsizetype(4));
    auto accepted = ParameterValidator::sanitizeInput({{"emoji", two}}, schema);
    ASSERT_EXPECTED_VALUE(accepted);
    QCOMPARE(accepted.value().value("emoji").toString(), two);

    auto tooLong = ParameterValidator::sanitizeInput({{"emoji", QString::fromUcs4(threeFaces, 3)}}, schema);
    QVERIFY(tooLong.hasError());
    QCOMPARE(tooLong.error().message, QString("Parameter 'emoji' must have length <= 2"));

    auto tooShort = ParameterValidator::sanitizeInput({{"emoji", QString::fromUcs4(oneFace, 1)}}, schema);
    QVERIFY(tooShort.hasError());
    QCOMPARE(tooShort.error().message, QString("Parameter 'emoji' must have length >= 2"));
}

void TestParameterValidator::testRulesAreCheckedInKeyOrder() {
    auto schema = schemaOf({
        {"zeta", QVariantMap{{"type", "string"}, {"required", true}}},
        {"alpha", QVariantMap{{"type", "string"}, {"required", true}}}
    });

    auto result = ParameterValidator::sanitizeInput(QVariantMap(), schema);
    QVERIFY(result.hasError());
    QCOMPARE(result.error().parameter, QString("alpha"));

    result = ParameterValidator::sanitizeInput({{"alpha", "a"}}, schema);
    QVERIFY(result.hasError());
    QCOMPARE(result.error().parameter, QString("zeta"));
}

void TestParameterValidator::testPatternIsAnchoredAtStart() {
    auto schema = schemaOf({{"id", QVariantMap{{"type", "string"}, {"pattern", "[0-9]+"}}}});

    QVERIFY(ParameterValidator::sanitizeInput({{"id", "123abc"}}, schema).hasValue());
    QVERIFY(ParameterValidator::sanitizeInput({{"id", "abc123"}}, schema).hasError());
}

void TestParameterValidator::testArrayItemsAreNamedByIndex() {
    auto schema = schemaOf({
        {"values", QVariantMap{{"type", "array"}, {"items", QVariantMap{{"type", "integer"}, {"min", 0}}}}}
    });

    auto coerced = ParameterValidator::sanitizeInput({{"values", QVariantList{"1", 2, 3.0}}}, schema);
    ASSERT_EXPECTED_VALUE(coerced);
    const QVariantList values = coerced.value().value("values").toList();
    QCOMPARE(values.size(), 3);
    QCOMPARE(values.at(0).toLongLong(), 1LL);

    auto rejected = ParameterValidator::sanitizeInput({{"values", QVariantList{1, -4}}}, schema);
    QVERIFY(rejected.hasError());
    QCOMPARE(rejected.error().parameter, QString("values[1]"));
}

void TestParameterValidator::testUnexpectedTopLevelParameters() {
    auto strict = schemaOf({{"a", QVariantMap{{"type", "integer"}}}}, false);

    auto rejected = ParameterValidator::sanitizeInput({{"a", 1}, {"x", 2}, {"y", 3}}, strict);
    QVERIFY(rejected.hasError());
    QCOMPARE(rejected.error().message, QString("Unexpected parameters: x, y"));

    auto lenient = schemaOf({{"a", QVariantMap{{"type", "integer"}}}}, true);
    auto accepted = ParameterValidator::sanitizeInput({{"a", 1}, {"x", "kept"}}, lenient);
    ASSERT_EXPECTED_VALUE(accepted);
    QCOMPARE(accepted.value().value("x").toString(), QString("kept"));
}

void TestParameterValidator::testNestedAdditionalPropertiesPrecedence() {
    const QVariantMap nestedOpen{
        {"type", "object"},
        {"properties", QVariantMap{{"host", QVariantMap{{"type", "string"}, {"required", true}}}}},
        {"allow_additional_properties", true}
    };
    const QVariantMap nestedClosed{
        {"type", "object"},
        {"properties", QVariantMap{{"host", QVariantMap{{"type", "string"}}}}},
        {"allow_additional_properties", false}
    };

    // Strict top level, open nested level: extra nested keys pass
    auto strictTop = schemaOf({{"server", nestedOpen}}, false);
    auto passes = ParameterValidator::sanitizeInput({{"server", QVariantMap{{"host", "h"}, {"port", 80}}}}, strictTop);
    ASSERT_EXPECTED_VALUE(passes);
    QCOMPARE(passes.value().value("server").toMap().value("port").toInt(), 80);

    // ...while extra top-level keys are still rejected
    auto topRejected = ParameterValidator::sanitizeInput({{"server", QVariantMap{{"host", "h"}}}, {"debug", true}},
                                                         strictTop);
    QVERIFY(topRejected.hasError());
    QCOMPARE(topRejected.error().message, QString("Unexpected parameters: debug"));

    // Open top level, closed nested level: the nested flag governs
    auto openTop = schemaOf({{"server", nestedClosed}}, true);
    auto nestedRejected = ParameterValidator::sanitizeInput({{"server", QVariantMap{{"host", "h"}, {"port", 80}}},
                                                             {"debug", true}}, openTop);
    QVERIFY(nestedRejected.hasError());
    QCOMPARE(nestedRejected.error().parameter, QString("server"));
    QCOMPARE(nestedRejected.error().message, QString("Unexpected properties in 'server': port"));

    // Declared rules are checked before unexpected keys at the same level
    auto strictBoth = schemaOf({{"server", nestedOpen}}, false);
    auto missingFirst = ParameterValidator::sanitizeInput({{"server", QVariantMap()}, {"debug", true}}, strictBoth);
    QVERIFY(missingFirst.hasError());
    QCOMPARE(missingFirst.error().message, QString("Missing required parameter: server.host"));
}

void TestParameterValidator::testInputSchemaIsNormalized() {
    PluginManifest manifest;
    manifest.name = "schema";
    manifest.entryPoint = "run";
    manifest.extensions["input_schema"] = QVariantMap{
        {"type", "object"},
        {"properties", QVariantMap{
            {"query", QVariantMap{{"type", "string"}, {"minLength", 3}}},
            {"limit", QVariantMap{{"type", "integer"}, {"maximum", 50}}}
        }},
        {"required", QVariantList{"query"}},
        {"additionalProperties", false}
    };

    ParameterSchema schema = ParameterSchema::fromManifest(manifest);
    QVERIFY(!schema.allowAdditional);
    QVERIFY(schema.rules.value("query").toMap().value("required").toBool());
    QCOMPARE(schema.rules.value("query").toMap().value("min_length").toInt(), 3);
    QCOMPARE(schema.rules.value("limit").toMap().value("max").toInt(), 50);

    auto missing = ParameterValidator::sanitizeInput({{"limit", 10}}, schema);
    QVERIFY(missing.hasError());
    QCOMPARE(missing.error().message, QString("Missing required parameter: query"));

    auto tooMany = ParameterValidator::sanitizeInput({{"query", "cats"}, {"limit", 51}}, schema);
    QVERIFY(tooMany.hasError());
    QCOMPARE(tooMany.error().parameter, QString("limit"));

    // The explicit manifest flag wins over the schema's additionalProperties
    manifest.extensions["allow_additional_parameters"] = true;
    QVERIFY(ParameterSchema::fromManifest(manifest).allowAdditional);
}

void TestParameterValidator::testParameterSizeGuard() {
    // The guard runs before any rule, so a missing required parameter is not reported
    auto schema = schemaOf({{"text", QVariantMap{{"required", true}}}});
    const QString blob(ParameterValidator::MAX_PARAMETER_BYTES + 16, QLatin1Char('a'));

    auto result = ParameterValidator::sanitizeInput({{"blob", blob}}, schema);
    QVERIFY(result.hasError());
    QVERIFY(result.error().message.startsWith("Parameters exceed maximum size of 1048576 bytes"));
}

void TestParameterValidator::testOutputWithinBudget() {
    ResourceLimits limits;
    limits.maxOutputSizeKb = 1;

    const QVariantMap small{{"ok", true}, {"items", QVariantList{1, 2, 3}}};
    auto result = ParameterValidator::sanitizeOutput(small, limits);
    ASSERT_EXPECTED_VALUE(result);
    QVERIFY(!result.value().truncated);
    QCOMPARE(result.value().value, QVariant(small));
}

void TestParameterValidator::testOversizedStringIsTruncated() {
    ResourceLimits limits;
    limits.maxOutputSizeKb = 1;

    const QString large(4096, QChar(0x00E9)); // two UTF-8 bytes each
    auto result = ParameterValidator::sanitizeOutput(large, limits);
    ASSERT_EXPECTED_VALUE(result);
    QVERIFY(result.value().truncated);
    QVERIFY(result.value().value.toString().endsWith(ParameterValidator::TRUNCATION_MARKER));
    QVERIFY(ParameterValidator::serializedSize(result.value().value) <= limits.maxOutputBytes());
}

void TestParameterValidator::testOversizedObjectFails() {
    ResourceLimits limits;
    limits.maxOutputSizeKb = 1;

    const QVariantMap large{{"data", QString(2 * 1024 * 1024, QLatin1Char('x'))}};
    auto result = ParameterValidator::sanitizeOutput(large, limits);
    QVERIFY(result.hasError());
    QCOMPARE(result.error().kind, PluginError::OutputTooLarge);
    QVERIFY(result.error().message.contains("too large"));
}

void TestParameterValidator::testNonSerializableOutputFallsBackToDebugText() {
    ResourceLimits limits;
    const QVariant point = QVariant::fromValue(QPoint(3, 4));
    QVERIFY(!ParameterValidator::isJsonSerializable(point));

    auto result = ParameterValidator::sanitizeOutput(point, limits);
    ASSERT_EXPECTED_VALUE(result);
    QCOMPARE(result.value().value.metaType().id(), int(QMetaType::QString));
    QVERIFY(result.value().value.toString().contains("QPoint"));

    limits.maxOutputSizeKb = 1;
    QVariantList manyPoints;
    for (int i = 0; i < 500; ++i) {
        manyPoints.append(QVariant::fromValue(QPoint(i, i)));
    }
    auto capped = ParameterValidator::sanitizeOutput(manyPoints, limits);
    ASSERT_EXPECTED_VALUE(capped);
    QVERIFY(capped.value().truncated);
    QVERIFY(ParameterValidator::serializedSize(capped.value().value) <= limits.maxOutputBytes());
}

int runTestParameterValidator(int argc, char** argv) {
    TestParameterValidator test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_parameter_validator.moc"

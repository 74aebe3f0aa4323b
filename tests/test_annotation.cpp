#include <gtest/gtest.h>

#include "insights/Annotation.hpp"
#include "insights/Errors.hpp"
#include "insights/Limits.hpp"

#include <string>
#include <vector>

namespace insights {

class AnnotationTest : public ::testing::Test {
protected:
    AnnotationFields fields() const {
        AnnotationFields f;
        f.path = "src/main.rs";
        f.line = 42;
        f.message = "unused variable";
        return f;
    }
};

TEST_F(AnnotationTest, LineOneIsAccepted) {
    AnnotationFields f = fields();
    f.line = 1;
    Annotation a(f);
    EXPECT_EQ(a.line(), 1);
}

TEST_F(AnnotationTest, LineZeroIsRejected) {
    AnnotationFields f = fields();
    f.line = 0;
    try {
        Annotation a(f);
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.field(), "line");
    }
}

TEST_F(AnnotationTest, NegativeLineIsRejected) {
    EXPECT_THROW(Annotation("src/main.rs", -3, "m"), ValidationError);
}

TEST_F(AnnotationTest, RequiredStringsMustNotBeEmpty) {
    AnnotationFields f = fields();
    f.path.clear();
    EXPECT_THROW(Annotation{f}, ValidationError);

    f = fields();
    f.message.clear();
    EXPECT_THROW(Annotation{f}, ValidationError);
}

TEST_F(AnnotationTest, LengthLimits) {
    AnnotationFields f = fields();
    f.message = std::string(limits::kAnnotationMessage, 'm');
    EXPECT_NO_THROW(Annotation{f});
    f.message = std::string(limits::kAnnotationMessage + 1, 'm');
    EXPECT_THROW(Annotation{f}, ValidationError);

    f = fields();
    f.external_id = std::string(limits::kAnnotationExternalId + 1, 'x');
    EXPECT_THROW(Annotation{f}, ValidationError);
}

TEST_F(AnnotationTest, OptionalFieldsDefaultToUnset) {
    Annotation a("src/main.rs", 42, "unused variable");
    EXPECT_FALSE(a.severity().has_value());
    EXPECT_FALSE(a.type().has_value());
    EXPECT_FALSE(a.link().has_value());
    EXPECT_FALSE(a.external_id().has_value());
    EXPECT_EQ(a, Annotation(fields()));
}

TEST_F(AnnotationTest, InvalidUtf8IsRejected) {
    try {
        Annotation a("src/\xc3", 1, "m");
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.field(), "path");
    }

    AnnotationFields f = fields();
    f.message = "bad \xff byte";
    EXPECT_THROW(Annotation{f}, ValidationError);

    f = fields();
    f.link = std::string("https://x.test/\x80");
    EXPECT_THROW(Annotation{f}, ValidationError);

    f = fields();
    f.external_id = std::string("id-\xe0\x80\x80");
    EXPECT_THROW(Annotation{f}, ValidationError);

    f = fields();
    f.message = "variable \xc3\xa9t\xc3\xa9 is unused";
    EXPECT_NO_THROW(Annotation{f});
}

TEST_F(AnnotationTest, BatchLimit) {
    std::vector<Annotation> many(limits::kAnnotationsPerBatch, Annotation(fields()));
    EXPECT_NO_THROW(AnnotationBatch{many});

    many.push_back(Annotation(fields()));
    EXPECT_THROW(AnnotationBatch{many}, ValidationError);
}

TEST(AnnotationTokenTest, SeverityAndTypeTokens) {
    EXPECT_STREQ(to_token(Severity::Low), "LOW");
    EXPECT_STREQ(to_token(Severity::Medium), "MEDIUM");
    EXPECT_STREQ(to_token(Severity::High), "HIGH");
    EXPECT_STREQ(to_token(AnnotationType::Vulnerability), "VULNERABILITY");
    EXPECT_STREQ(to_token(AnnotationType::CodeSmell), "CODE_SMELL");
    EXPECT_STREQ(to_token(AnnotationType::Bug), "BUG");

    EXPECT_EQ(parse_severity("HIGH"), Severity::High);
    EXPECT_FALSE(parse_severity("high").has_value());
    EXPECT_EQ(parse_annotation_type("CODE_SMELL"), AnnotationType::CodeSmell);
    EXPECT_FALSE(parse_annotation_type("CODESMELL").has_value());
}

}  // namespace insights

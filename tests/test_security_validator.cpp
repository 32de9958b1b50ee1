#include <gtest/gtest.h>
#include "policy/security_validator.hpp"
#include <algorithm>
#include <memory>
#include <string>

using namespace mathviz::policy;

namespace {

const char* SAFE_SCRIPT = R"PY(import matplotlib
matplotlib.use('Agg')
import matplotlib.pyplot as plt
import numpy as np

plt.rcParams['font.sans-serif'] = ['SimHei']
x = np.linspace(0, 2 * np.pi, 100)
y = np.sin(x)
fig, ax = plt.subplots()
ax.plot(x, y)
ax.set_title('sine')
plt.savefig(output_path)
result = {'max': float(y.max()), 'points': len(x)}
)PY";

bool has(const std::vector<std::string>& items, const std::string& expected) {
    return std::find(items.begin(), items.end(), expected) != items.end();
}

bool has_prefix(const std::vector<std::string>& items, const std::string& prefix) {
    return std::any_of(items.begin(), items.end(), [&](const std::string& item) {
        return item.rfind(prefix, 0) == 0;
    });
}

} // anonymous namespace

class SecurityValidatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        validator = std::make_unique<SecurityValidator>(
            std::make_shared<const SecurityPolicy>(SecurityPolicy::defaults()));
    }

    std::unique_ptr<SecurityValidator> validator;
};

TEST_F(SecurityValidatorTest, AcceptsTypicalPlotScript) {
    CodeValidationResult result = validator->validate(SAFE_SCRIPT);
    EXPECT_TRUE(result.is_valid);
    EXPECT_TRUE(result.security_issues.empty());
    EXPECT_TRUE(result.syntax_errors.empty());
    EXPECT_TRUE(result.warnings.empty());
    EXPECT_GE(result.validation_time, 0.0);
}

TEST_F(SecurityValidatorTest, ReportsSyntaxErrorOnly) {
    CodeValidationResult result = validator->validate("x = (1,\nimport os\n");
    EXPECT_FALSE(result.is_valid);
    ASSERT_EQ(result.syntax_errors.size(), 1u);
    EXPECT_EQ(result.syntax_errors[0].rfind("syntax error: ", 0), 0u);
    EXPECT_NE(result.syntax_errors[0].find("(line "), std::string::npos);
    EXPECT_TRUE(result.security_issues.empty());
    EXPECT_TRUE(result.warnings.empty());
}

TEST_F(SecurityValidatorTest, AgreesWithInterpreterGrammar) {
    CodeValidationResult match = validator->validate(
        "x = 1\nmatch x:\n    case 1:\n        y = 2\n    case _:\n        y = 0\n");
    EXPECT_TRUE(match.syntax_errors.empty()) << match.syntax_errors.front();

    CodeValidationResult modern = validator->validate(
        "def scale(v, /, factor=2, *, offset=0):\n"
        "    return v * factor + offset\n"
        "if (n := scale(3)) > 5:\n"
        "    label = f'{n=}'\n");
    EXPECT_TRUE(modern.is_valid) << ::testing::PrintToString(modern.security_issues);

    CodeValidationResult mixed = validator->validate("s = 'a' \"b\" rb'c' f'{1}'\n");
    EXPECT_FALSE(mixed.is_valid);
    ASSERT_EQ(mixed.syntax_errors.size(), 1u);
    EXPECT_NE(mixed.syntax_errors[0].find("bytes"), std::string::npos);
}

TEST_F(SecurityValidatorTest, RejectsInvalidUtf8WithPosition) {
    CodeValidationResult result = validator->validate("x = 1\ny = '\xff'\n");
    ASSERT_EQ(result.syntax_errors.size(), 1u);
    EXPECT_EQ(result.syntax_errors[0], "syntax error: source is not valid UTF-8 (line 2, column 6)");
}

TEST_F(SecurityValidatorTest, FlagsForbiddenFunctionCall) {
    CodeValidationResult result = validator->validate("value = eval('1 + 1')\n");
    EXPECT_FALSE(result.is_valid);
    EXPECT_TRUE(has(result.security_issues, "forbidden function call: eval"));
    EXPECT_TRUE(has(result.security_issues, "forbidden name reference: eval"));
    EXPECT_TRUE(has(result.security_issues, "dangerous code pattern: eval\\s*\\("));
}

TEST_F(SecurityValidatorTest, FlagsForbiddenMethodAndAttribute) {
    CodeValidationResult result = validator->validate("helper.getattr(obj, 'x')\nf = helper.globals\n");
    EXPECT_TRUE(has(result.security_issues, "forbidden method call: getattr"));
    EXPECT_TRUE(has(result.security_issues, "forbidden attribute access: getattr"));
    EXPECT_TRUE(has(result.security_issues, "forbidden attribute access: globals"));
}

TEST_F(SecurityValidatorTest, FlagsForbiddenNameInAssignment) {
    CodeValidationResult result = validator->validate("type = 3\n");
    EXPECT_TRUE(has(result.security_issues, "forbidden name reference: type"));
    EXPECT_FALSE(has_prefix(result.security_issues, "forbidden function call"));
}

TEST_F(SecurityValidatorTest, ChecksImports) {
    CodeValidationResult result = validator->validate(
        "import os\n"
        "from subprocess import run\n"
        "import pandas as pd\n"
        "from . import sibling\n"
        "import numpy.linalg\n"
        "from matplotlib import cm\n");

    EXPECT_TRUE(has(result.security_issues, "forbidden module import: os"));
    EXPECT_TRUE(has(result.security_issues, "forbidden import from module: subprocess"));
    EXPECT_TRUE(has(result.security_issues, "unauthorized module import: pandas"));
    EXPECT_TRUE(has(result.security_issues, "unauthorized module import: ."));
    EXPECT_FALSE(has(result.security_issues, "unauthorized module import: numpy.linalg"));
    EXPECT_FALSE(has(result.security_issues, "unauthorized module import: matplotlib"));
}

TEST_F(SecurityValidatorTest, FlagsFileOperationWithOffset) {
    CodeValidationResult result = validator->validate("f = open('data.txt')\n");
    EXPECT_TRUE(has(result.security_issues, "forbidden file operation: open( (offset 4)"));
    EXPECT_TRUE(has(result.security_issues, "forbidden function call: open"));
}

TEST_F(SecurityValidatorTest, ToleratesFileOperationNearSavefig) {
    CodeValidationResult near = validator->validate("plt.savefig(name); h = open(name)\n");
    EXPECT_FALSE(has_prefix(near.security_issues, "forbidden file operation"));
    // The call itself is still caught by the syntax tree check
    EXPECT_TRUE(has(near.security_issues, "forbidden function call: open"));

    std::string far = "plt.savefig(name)\n" + std::string(80, '#') + "\nh = open(name)\n";
    CodeValidationResult distant = validator->validate(far);
    EXPECT_TRUE(has_prefix(distant.security_issues, "forbidden file operation: open("));
}

TEST_F(SecurityValidatorTest, FlagsNetworkAccess) {
    CodeValidationResult result = validator->validate("url = 'https://example.com/data'\n");
    EXPECT_FALSE(result.is_valid);
    EXPECT_TRUE(has(result.security_issues, "forbidden network access: http[s]?://"));
    EXPECT_TRUE(has(result.security_issues, "dangerous code pattern: http[s]?://"));
}

TEST_F(SecurityValidatorTest, PatternsAreCaseInsensitive) {
    CodeValidationResult result = validator->validate("EVAL ('x')\n");
    EXPECT_FALSE(has_prefix(result.security_issues, "forbidden function call"));
    EXPECT_TRUE(has(result.security_issues, "dangerous code pattern: eval\\s*\\("));
}

TEST_F(SecurityValidatorTest, ChecksAreAdditive) {
    CodeValidationResult result = validator->validate("import os\nos.system('ls')\n");
    EXPECT_TRUE(has(result.security_issues, "forbidden module import: os"));
    EXPECT_TRUE(has(result.security_issues, "dangerous code pattern: import\\s+os"));
    EXPECT_TRUE(has(result.security_issues, "dangerous code pattern: \\.system\\s*\\("));
}

TEST_F(SecurityValidatorTest, DunderNamesAreDangerous) {
    CodeValidationResult result = validator->validate("x = ().__class__\n");
    EXPECT_TRUE(has(result.security_issues, "dangerous code pattern: __.*__"));
}

TEST_F(SecurityValidatorTest, FlagsModulesReachedThroughAllowedOnes) {
    CodeValidationResult result = validator->validate(
        "run = random._os.system\nrun(\"touch /tmp/mathviz_marker\")\nresult = {\"ok\": 1}\n");
    EXPECT_FALSE(result.is_valid);
    EXPECT_TRUE(has(result.security_issues, "private attribute access: _os"));
    EXPECT_TRUE(has(result.security_issues, "forbidden module reference: _os"));

    CodeValidationResult public_name = validator->validate("cwd = matplotlib.os.getcwd\n");
    EXPECT_TRUE(has(public_name.security_issues, "forbidden module reference: os"));
    EXPECT_FALSE(has_prefix(public_name.security_issues, "private attribute access"));
}

TEST_F(SecurityValidatorTest, RejectsHandlersThatCatchInterrupts) {
    CodeValidationResult bare = validator->validate(
        "while True:\n    try:\n        pass\n    except:\n        pass\n");
    EXPECT_TRUE(has(bare.security_issues, "forbidden exception handler: bare except"));

    CodeValidationResult base = validator->validate(
        "try:\n    pass\nexcept BaseException:\n    pass\n");
    EXPECT_TRUE(has(base.security_issues, "forbidden exception handler: BaseException"));

    CodeValidationResult tuple = validator->validate(
        "try:\n    pass\nexcept (ValueError, KeyboardInterrupt) as e:\n    pass\n");
    EXPECT_TRUE(has(tuple.security_issues, "forbidden exception handler: KeyboardInterrupt"));

    CodeValidationResult ordinary = validator->validate(
        "try:\n    x = 1 / 0\nexcept (ZeroDivisionError, Exception):\n    x = 0\n");
    EXPECT_TRUE(ordinary.is_valid) << ::testing::PrintToString(ordinary.security_issues);
}

TEST_F(SecurityValidatorTest, ScansLongLinesWithoutCrashing) {
    std::string code = "x = \"__" + std::string(90000, 'a') + "__\"\n";
    CodeValidationResult result = validator->validate(code);
    EXPECT_TRUE(has(result.security_issues, "dangerous code pattern: __.*__"));
    EXPECT_TRUE(has_prefix(result.warnings, "code is very long"));

    std::string unmatched = "x = \"__" + std::string(90000, 'a') + "\"\n";
    EXPECT_TRUE(validator->validate(unmatched).is_valid);
}

TEST_F(SecurityValidatorTest, RejectsOversizedCode) {
    std::string code(100001, '#');
    CodeValidationResult result = validator->validate(code);
    EXPECT_FALSE(result.is_valid);
    ASSERT_EQ(result.security_issues.size(), 1u);
    EXPECT_EQ(result.security_issues[0], "code too large (100001 bytes, limit 100000)");
    EXPECT_TRUE(result.syntax_errors.empty());
}

TEST_F(SecurityValidatorTest, IsDeterministic) {
    const std::string code = "import os\nvalue = eval('2')\nurl = 'ftp://host'\n";
    CodeValidationResult first = validator->validate(code);
    CodeValidationResult second = validator->validate(code);
    EXPECT_EQ(first.is_valid, second.is_valid);
    EXPECT_EQ(first.security_issues, second.security_issues);
    EXPECT_EQ(first.warnings, second.warnings);
}

TEST_F(SecurityValidatorTest, WarnsWithoutAffectingValidity) {
    CodeValidationResult result = validator->validate("x = 1\n");
    EXPECT_TRUE(result.is_valid);
    EXPECT_TRUE(has_prefix(result.warnings, "code is very short"));
    EXPECT_TRUE(has_prefix(result.warnings, "code should use matplotlib"));
    EXPECT_TRUE(has_prefix(result.warnings, "code should save the figure"));
    EXPECT_TRUE(has_prefix(result.warnings, "define a 'result' variable"));
}

TEST_F(SecurityValidatorTest, WarnsOnDeepNesting) {
    std::string code =
        "if a:\n"
        "    for i in x:\n"
        "        while b:\n"
        "            if c:\n"
        "                if d:\n"
        "                    pass\n";
    CodeValidationResult result = validator->validate(code);
    EXPECT_TRUE(has(result.warnings, "nesting too deep (depth 5)"));

    // elif nests inside the parent's else branch
    CodeValidationResult chain = validator->validate(
        "if a:\n    pass\nelif b:\n    pass\nelif c:\n    pass\n");
    EXPECT_FALSE(has_prefix(chain.warnings, "nesting too deep"));
}

TEST_F(SecurityValidatorTest, WarnsOnDuplicatedLines) {
    std::string code;
    for (int i = 0; i < 60; ++i) {
        code += "ax.plot(x, y)\n";
    }
    CodeValidationResult result = validator->validate(code);
    EXPECT_TRUE(has_prefix(result.warnings, "high line duplication"));
}

TEST_F(SecurityValidatorTest, ReportsPolicyTables) {
    nlohmann::json report = validator->get_security_report();
    EXPECT_EQ(report["forbidden_functions_count"].get<size_t>(), DEFAULT_FORBIDDEN_FUNCTIONS.size());
    EXPECT_EQ(report["sanctioned_save_call"], "savefig");
    EXPECT_TRUE(report["allowed_modules"].is_array());
}

TEST(SecurityValidatorPolicyTest, CustomPolicyChangesDecisions) {
    SecurityPolicy policy = SecurityPolicy::defaults();
    policy.allowed_modules.insert("pandas");
    SecurityValidator validator(std::make_shared<const SecurityPolicy>(policy));

    CodeValidationResult result = validator.validate("import pandas as pd\n");
    EXPECT_TRUE(result.is_valid);
}

TEST(SecurityValidatorPolicyTest, RejectsBadPatternAtConstruction) {
    SecurityPolicy policy = SecurityPolicy::defaults();
    policy.network_patterns.push_back("[unclosed");
    EXPECT_THROW(SecurityValidator(std::make_shared<const SecurityPolicy>(policy)), PolicyError);
}

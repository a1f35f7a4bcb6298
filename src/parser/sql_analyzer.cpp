// ---------------------------------------------------------------------------
// sql_analyzer.cpp
//
// StructuralFacts 추출 구현.
//
// [처리 순서]
//   1. SqlLexer 로 토큰화 (문자열/주석 경계 확정)
//   2. 주석을 제외한 "코드 토큰" 목록 구성
//   3. 코드 토큰 한 번 순회: 괄호 깊이, 구문 수, UNION/JOIN/서브쿼리,
//      함수 호출, 문자열 결합
//   4. 첫 번째 구문에서 구문 유형과 LIMIT 절 추출
//   5. 상수 조건(tautology / constant_false) 평가
//   6. 주석 토큰 검사 (주석 분할, 버전 주석 내부 재분석)
//
// [우회 주의]
// - 코드 토큰 목록에서는 주석이 빠지므로 SLEEP/**/(5) 도 SLEEP( 로 인식된다.
// - MySQL 은 /*!50000 ... */ 내부를 실행하므로, 내부 텍스트를 다시
//   토큰화하여 키워드/함수 목록에 합친다. /*!DROP*/ 도 DROP 키워드로 잡힌다.
// ---------------------------------------------------------------------------

#include "parser/sql_analyzer.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <limits>
#include <string>
#include <unordered_set>

#include "parser/sql_lexer.hpp"

namespace {

using TokenRefs = std::vector<const Token*>;

// "이름(" 형태지만 함수 호출이 아닌 키워드
const std::unordered_set<std::string_view> kNotFunctions = {
    "IN",     "VALUES", "EXISTS",  "AS",      "FROM",    "JOIN",  "ON",     "AND",
    "OR",     "NOT",    "WHERE",   "SELECT",  "USING",   "OVER",  "ANY",    "ALL",
    "SOME",   "UNION",  "INTO",    "TABLE",   "WITH",    "LIMIT", "DISTINCT", "WHEN",
    "THEN",   "ELSE",   "BY",      "IS",      "LIKE",    "BETWEEN", "HAVING", "SET",
    "RECURSIVE", "LATERAL", "OF",  "RETURNS", "KEY",     "INDEX", "PRIMARY", "UNIQUE",
};

// 직후의 "이름(" 이 테이블/CTE 컬럼 목록임을 나타내는 키워드
const std::unordered_set<std::string_view> kTableContextWords = {
    "INTO", "TABLE", "REFERENCES", "WITH", "RECURSIVE", "ON",
};

// 조건식 끝을 나타내는 키워드
const std::unordered_set<std::string_view> kClauseEndWords = {
    "LIMIT", "ORDER", "GROUP", "UNION", "HAVING", "WINDOW", "FOR", "OFFSET", "FETCH",
    "INTERSECT", "EXCEPT", "THEN",
};

const std::unordered_set<std::string_view> kComparisonOperators = {
    "=", "==", "<>", "!=", "<", ">", "<=", ">=", "<=>",
};

bool is_word(const Token* t, std::string_view upper) {
    return t != nullptr && t->is_word(upper);
}

// 숫자 토큰이 부호 없는 정수면 값을 반환한다. 오버플로는 UINT64_MAX 로 포화.
std::optional<std::uint64_t> parse_integer(const Token& t) {
    if (t.type != TokenType::kNumber || t.value.empty()) {
        return std::nullopt;
    }
    if (!std::all_of(t.value.begin(), t.value.end(),
                     [](unsigned char c) { return c >= '0' && c <= '9'; })) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    const auto [ptr, ec] = std::from_chars(t.value.data(), t.value.data() + t.value.size(), value);
    if (ec == std::errc::result_out_of_range) {
        return std::numeric_limits<std::uint64_t>::max();
    }
    if (ec != std::errc{} || ptr != t.value.data() + t.value.size()) {
        return std::nullopt;
    }
    return value;
}

// MySQL 식 숫자 변환: 숫자로 시작하지 않는 문자열은 0
double literal_as_number(const Token& t) {
    return std::strtod(t.value.c_str(), nullptr);
}

// <리터럴> op <리터럴> 평가. 문자열끼리는 대소문자 무관 비교.
bool evaluate_comparison(const Token& lhs, std::string_view op, const Token& rhs) {
    int cmp = 0;
    if (lhs.type == TokenType::kString && rhs.type == TokenType::kString) {
        const std::string a = to_upper_ascii(lhs.value);
        const std::string b = to_upper_ascii(rhs.value);
        cmp = (a < b) ? -1 : (a > b ? 1 : 0);
    } else {
        const double a = literal_as_number(lhs);
        const double b = literal_as_number(rhs);
        cmp = (a < b) ? -1 : (a > b ? 1 : 0);
    }

    if (op == "=" || op == "==" || op == "<=>") return cmp == 0;
    if (op == "<>" || op == "!=")               return cmp != 0;
    if (op == "<")                              return cmp < 0;
    if (op == ">")                              return cmp > 0;
    if (op == "<=")                             return cmp <= 0;
    if (op == ">=")                             return cmp >= 0;
    return false;
}

bool is_comparable_literal(const Token* t) {
    return t->type == TokenType::kNumber || t->type == TokenType::kString;
}

enum class Connector : std::uint8_t {
    kNone       = 0,
    kOr         = 1,
    kAnd        = 2,
    kClauseEdge = 3,  // WHERE/ON/HAVING 직후, 또는 조건식 끝 직전
};

// idx 위치 토큰 앞의 논리 연결자. 여는 괄호는 건너뛴다.
Connector connector_before(const TokenRefs& code, std::size_t idx) {
    std::size_t j = idx;
    while (j > 0 && code[j - 1]->type == TokenType::kLeftParen) {
        --j;
    }
    if (j == 0) {
        return Connector::kNone;
    }
    const Token* p = code[j - 1];
    if (p->is_word("OR") || p->is_word("XOR") || p->is_operator("||")) return Connector::kOr;
    if (p->is_word("AND") || p->is_operator("&&"))                     return Connector::kAnd;
    if (p->is_word("WHERE") || p->is_word("ON") || p->is_word("HAVING")) return Connector::kClauseEdge;
    return Connector::kNone;
}

// idx 위치 토큰 뒤의 논리 연결자. 닫는 괄호는 건너뛴다.
Connector connector_after(const TokenRefs& code, std::size_t idx) {
    std::size_t j = idx + 1;
    while (j < code.size() && code[j]->type == TokenType::kRightParen) {
        ++j;
    }
    if (j >= code.size() || code[j]->type == TokenType::kSemicolon) {
        return Connector::kClauseEdge;
    }
    const Token* n = code[j];
    if (n->is_word("OR") || n->is_word("XOR") || n->is_operator("||")) return Connector::kOr;
    if (n->is_word("AND") || n->is_operator("&&"))                     return Connector::kAnd;
    if (n->type == TokenType::kWord && kClauseEndWords.contains(n->value)) {
        return Connector::kClauseEdge;
    }
    return Connector::kNone;
}

// 산술/비교 연산자에 붙어 있으면 독립된 조건이 아니다 (a + 1 = 1 등)
bool is_bound_operand(const Token* neighbor) {
    return neighbor->type == TokenType::kOperator
        && !neighbor->is_operator("||")
        && !neighbor->is_operator("&&");
}

void add_unique(std::vector<std::string>& out, const std::string& name) {
    if (std::find(out.begin(), out.end(), name) == out.end()) {
        out.push_back(name);
    }
}

// 코드 토큰에서 키워드와 함수 호출 이름을 수집한다.
void collect_names(const TokenRefs& code,
                   std::vector<std::string>& keywords,
                   std::vector<std::string>& functions) {
    for (std::size_t i = 0; i < code.size(); ++i) {
        const Token* t = code[i];
        if (t->type != TokenType::kWord) {
            continue;
        }
        keywords.push_back(t->value);

        if (i + 1 >= code.size() || code[i + 1]->type != TokenType::kLeftParen) {
            continue;
        }
        if (kNotFunctions.contains(t->value)) {
            continue;
        }
        // schema.name( 은 앞의 "이름 ." 쌍을 건너뛰고 문맥 키워드를 본다
        std::size_t j = i;
        while (j >= 2 && code[j - 1]->is_operator(".")) {
            j -= 2;
        }
        if (j > 0 && code[j - 1]->type == TokenType::kWord &&
            kTableContextWords.contains(code[j - 1]->value)) {
            continue;
        }
        add_unique(functions, t->value);
    }
}

// CONCAT(...) 인자 중 최상위 문자열 리터럴이 있는지
bool call_has_string_argument(const TokenRefs& code, std::size_t open_paren) {
    std::size_t depth = 0;
    for (std::size_t i = open_paren; i < code.size(); ++i) {
        const Token* t = code[i];
        if (t->type == TokenType::kLeftParen) {
            ++depth;
        } else if (t->type == TokenType::kRightParen) {
            if (--depth == 0) {
                return false;
            }
        } else if (depth == 1 && t->type == TokenType::kString) {
            return true;
        }
    }
    return false;
}

// 첫 번째 구문의 구문 유형. WITH 는 CTE 목록 뒤의 DML 키워드로 결정한다.
StatementType classify_statement(const TokenRefs& code, std::size_t begin, std::size_t end) {
    std::size_t i = begin;
    while (i < end && code[i]->type == TokenType::kLeftParen) {
        ++i;
    }
    if (i >= end || code[i]->type != TokenType::kWord) {
        return StatementType::kUnknown;
    }

    const std::string& first = code[i]->value;
    if (first == "WITH") {
        std::size_t depth = 0;
        for (std::size_t j = i + 1; j < end; ++j) {
            const Token* t = code[j];
            if (t->type == TokenType::kLeftParen) {
                ++depth;
            } else if (t->type == TokenType::kRightParen) {
                depth = depth > 0 ? depth - 1 : 0;
            } else if (depth == 0 && t->type == TokenType::kWord) {
                if (t->value == "SELECT" || t->value == "INSERT" || t->value == "UPDATE" ||
                    t->value == "DELETE" || t->value == "REPLACE" || t->value == "MERGE") {
                    return statement_type_from_string(t->value).value_or(StatementType::kUnknown);
                }
            }
        }
        return StatementType::kUnknown;
    }
    if (first == "DESC") {
        return StatementType::kDescribe;
    }
    return statement_type_from_string(first).value_or(StatementType::kUnknown);
}

LimitClause make_limit(const Token& value_token, LimitSyntax syntax) {
    LimitClause clause;
    clause.value        = parse_integer(value_token);
    clause.value_offset = value_token.offset;
    clause.value_length = value_token.length;
    clause.syntax       = syntax;
    return clause;
}

// code[i] 에서 시작하는 LIMIT / TOP / FETCH FIRST 절
std::optional<LimitClause> limit_at(const TokenRefs& code, std::size_t i, std::size_t begin, std::size_t end) {
    const Token* t  = code[i];
    const Token* n1 = (i + 1 < end) ? code[i + 1] : nullptr;
    const Token* n2 = (i + 2 < end) ? code[i + 2] : nullptr;
    const Token* n3 = (i + 3 < end) ? code[i + 3] : nullptr;

    if (t->value == "LIMIT") {
        if (n1 == nullptr) {
            LimitClause clause;
            clause.value_offset = t->end();
            return clause;
        }
        if (n2 != nullptr && n2->type == TokenType::kComma && n3 != nullptr) {
            return make_limit(*n3, LimitSyntax::kLimitComma);
        }
        if (is_word(n2, "OFFSET")) {
            return make_limit(*n1, LimitSyntax::kLimitOffset);
        }
        return make_limit(*n1, LimitSyntax::kLimit);
    }

    if (t->value == "TOP" && i > begin &&
        (is_word(code[i - 1], "SELECT") || is_word(code[i - 1], "DISTINCT"))) {
        if (n1 != nullptr && n1->type == TokenType::kLeftParen && n2 != nullptr) {
            return make_limit(*n2, LimitSyntax::kTop);
        }
        if (n1 != nullptr) {
            return make_limit(*n1, LimitSyntax::kTop);
        }
    }

    if (t->value == "FETCH" && (is_word(n1, "FIRST") || is_word(n1, "NEXT"))) {
        if (is_word(n2, "ROW") || is_word(n2, "ROWS")) {
            LimitClause clause;  // FETCH FIRST ROW ONLY == 1 행
            clause.value        = 1;
            clause.value_offset = n1->end();
            clause.syntax       = LimitSyntax::kFetchFirst;
            return clause;
        }
        if (n2 != nullptr) {
            return make_limit(*n2, LimitSyntax::kFetchFirst);
        }
    }
    return std::nullopt;
}

// 첫 번째 구문 최상위의 LIMIT / TOP / FETCH FIRST 절
//   "(SELECT ... LIMIT n)" 처럼 선행 괄호 안쪽(depth == base)의 절과
//   "(SELECT ...) LIMIT n" 처럼 괄호가 닫힌 뒤(depth 0)의 절을 모두 본다.
//   둘 다 있으면 결과 전체를 제한하는 바깥쪽 절이 우선한다.
std::optional<LimitClause> find_limit(const TokenRefs& code, std::size_t begin, std::size_t end) {
    std::size_t base = 0;
    while (begin + base < end && code[begin + base]->type == TokenType::kLeftParen) {
        ++base;
    }

    std::optional<LimitClause> inner;
    std::size_t                depth = 0;
    for (std::size_t i = begin; i < end; ++i) {
        const Token* t = code[i];
        if (t->type == TokenType::kLeftParen) {
            ++depth;
            continue;
        }
        if (t->type == TokenType::kRightParen) {
            depth = depth > 0 ? depth - 1 : 0;
            continue;
        }
        if (t->type != TokenType::kWord) {
            continue;
        }
        if (depth == 0) {
            if (auto clause = limit_at(code, i, begin, end)) {
                return clause;
            }
        } else if (depth == base && !inner) {
            inner = limit_at(code, i, begin, end);
        }
    }
    return inner;
}

// 끝 주석에 홀수 개의 따옴표가 있으면 원래 닫는 따옴표가 주석에 묻힌 것
bool trailing_comment_hides_quote(const std::vector<Token>& tokens) {
    if (tokens.empty()) {
        return false;
    }
    const Token& last = tokens.back();
    if (last.type != TokenType::kLineComment && last.type != TokenType::kHashComment) {
        return false;
    }
    const auto singles = std::count(last.value.begin(), last.value.end(), '\'');
    const auto doubles = std::count(last.value.begin(), last.value.end(), '"');
    return singles % 2 == 1 || doubles % 2 == 1;
}

void evaluate_quote_break(const LexResult& lex, const TokenRefs& code, StructuralFacts& facts) {
    if (!lex.unterminated_string && !trailing_comment_hides_quote(lex.tokens)) {
        return;
    }
    for (std::size_t i = 0; i + 1 < code.size(); ++i) {
        if (code[i]->type != TokenType::kString) {
            continue;
        }
        std::size_t j = i + 1;
        if (code[j]->type == TokenType::kRightParen && j + 1 < code.size()) {
            ++j;  // ') UNION ...
        }
        const Token* next = code[j];
        if (next->is_word("OR") || next->is_word("AND")) {
            facts.quote_break_before_logic = true;
        } else if (next->is_word("UNION")) {
            facts.quote_break_before_union = true;
        }
    }
}

void evaluate_constant_conditions(const TokenRefs& code, StructuralFacts& facts) {
    for (std::size_t i = 0; i + 2 < code.size(); ++i) {
        const Token* lhs = code[i];
        const Token* op  = code[i + 1];
        const Token* rhs = code[i + 2];
        if (!is_comparable_literal(lhs) || !is_comparable_literal(rhs) ||
            op->type != TokenType::kOperator || !kComparisonOperators.contains(op->value)) {
            continue;
        }
        if (i > 0 && is_bound_operand(code[i - 1])) {
            continue;
        }
        if (i + 3 < code.size() && is_bound_operand(code[i + 3])) {
            continue;
        }

        ++facts.constant_condition_count;
        const bool      value  = evaluate_comparison(*lhs, op->value, *rhs);
        const Connector before = connector_before(code, i);
        const Connector after  = connector_after(code, i + 2);
        const bool whole_condition = before == Connector::kClauseEdge && after == Connector::kClauseEdge;

        if (value && (before == Connector::kOr || after == Connector::kOr || whole_condition)) {
            facts.tautology = true;
        }
        if (!value && (before == Connector::kAnd || after == Connector::kAnd || whole_condition)) {
            facts.constant_false = true;
        }
    }

    // OR 1 / OR TRUE 처럼 비교 없이 참인 피연산자
    for (std::size_t i = 0; i + 1 < code.size(); ++i) {
        if (!code[i]->is_word("OR")) {
            continue;
        }
        const Token* operand = code[i + 1];
        const bool truthy =
            operand->is_word("TRUE") ||
            (operand->type == TokenType::kNumber && literal_as_number(*operand) != 0.0);
        if (!truthy) {
            continue;
        }
        if (i + 2 < code.size()) {
            const Token* next = code[i + 2];
            if (next->type != TokenType::kRightParen &&
                connector_after(code, i + 1) == Connector::kNone) {
                continue;
            }
        }
        facts.tautology = true;
    }
}

void add_degraded(StructuralFacts& facts, DegradedReason reason) {
    facts.degraded = true;
    if (std::find(facts.degraded_reasons.begin(), facts.degraded_reasons.end(), reason) ==
        facts.degraded_reasons.end()) {
        facts.degraded_reasons.push_back(reason);
    }
}

// /*!50000 ... */ 에서 실행될 본문만 잘라낸다
std::string_view versioned_comment_body(std::string_view comment) {
    std::string_view body = comment.substr(3);
    if (body.size() >= 2 && body.substr(body.size() - 2) == "*/") {
        body.remove_suffix(2);
    }
    std::size_t skip = 0;
    while (skip < body.size() && body[skip] >= '0' && body[skip] <= '9') {
        ++skip;
    }
    return body.substr(skip);
}

}  // namespace

std::string_view to_string(DegradedReason reason) noexcept {
    switch (reason) {
        case DegradedReason::kUnterminatedString:    return "unterminated_string";
        case DegradedReason::kUnterminatedComment:   return "unterminated_comment";
        case DegradedReason::kUnbalancedParentheses: return "unbalanced_parentheses";
        case DegradedReason::kEmbeddedNul:           return "embedded_nul";
        default:                                     return "unknown";
    }
}

bool StructuralFacts::has_keyword(std::string_view upper) const {
    return std::binary_search(keywords.begin(), keywords.end(), upper,
                              [](std::string_view a, std::string_view b) { return a < b; });
}

bool StructuralFacts::calls_function(std::string_view upper) const {
    return std::find(function_calls.begin(), function_calls.end(), upper) != function_calls.end();
}

SqlAnalyzer::SqlAnalyzer(AnalyzerOptions options)
    : options_(options)
{}

StructuralFacts SqlAnalyzer::analyze(std::string_view sql) const {
    StructuralFacts facts;
    facts.length   = sql.size();
    facts.too_long = sql.size() > options_.max_query_length;

    const LexResult lex = SqlLexer::tokenize(sql);
    if (lex.unterminated_string) {
        add_degraded(facts, DegradedReason::kUnterminatedString);
    }
    if (lex.unterminated_comment) {
        add_degraded(facts, DegradedReason::kUnterminatedComment);
    }
    if (lex.embedded_nul) {
        add_degraded(facts, DegradedReason::kEmbeddedNul);
    }

    TokenRefs code;
    code.reserve(lex.tokens.size());
    for (const auto& tok : lex.tokens) {
        if (!tok.is_comment()) {
            code.push_back(&tok);
        }
    }

    // -- 코드 토큰 순회 ------------------------------------------------------
    std::size_t depth              = 0;
    bool        unbalanced         = false;
    bool        segment_has_tokens = false;
    std::size_t first_statement_end = code.size();

    for (std::size_t i = 0; i < code.size(); ++i) {
        const Token* t    = code[i];
        const Token* next = (i + 1 < code.size()) ? code[i + 1] : nullptr;

        switch (t->type) {
            case TokenType::kLeftParen:
                ++depth;
                facts.max_paren_depth = std::max(facts.max_paren_depth, depth);
                if (is_word(next, "SELECT") || is_word(next, "WITH")) {
                    ++facts.subquery_count;
                }
                break;
            case TokenType::kRightParen:
                if (depth == 0) {
                    unbalanced = true;
                } else {
                    --depth;
                }
                break;
            case TokenType::kSemicolon:
                if (segment_has_tokens) {
                    ++facts.statement_count;
                    if (facts.statement_count == 1) {
                        first_statement_end = i;
                    }
                }
                segment_has_tokens = false;
                continue;
            case TokenType::kWord:
                if (t->value == "UNION") {
                    ++facts.union_count;
                } else if (t->value == "JOIN") {
                    ++facts.join_count;
                } else if (t->value == "X" && next != nullptr &&
                           next->type == TokenType::kString && next->offset == t->end()) {
                    facts.has_hex_literal = true;  // X'414243'
                } else if ((t->value == "CONCAT" || t->value == "CONCAT_WS") &&
                           next != nullptr && next->type == TokenType::kLeftParen) {
                    ++facts.concat_operator_count;
                    if (call_has_string_argument(code, i + 1)) {
                        ++facts.suspicious_concat_count;
                    }
                }
                break;
            case TokenType::kHexNumber:
                facts.has_hex_literal = true;
                break;
            case TokenType::kString:
                if (next != nullptr && next->type == TokenType::kString) {
                    ++facts.adjacent_literals;
                    ++facts.suspicious_concat_count;
                }
                break;
            case TokenType::kOperator:
                if (t->value == "||") {
                    ++facts.concat_operator_count;
                    const bool string_operand =
                        (i > 0 && code[i - 1]->type == TokenType::kString) ||
                        (next != nullptr && next->type == TokenType::kString);
                    if (string_operand) {
                        ++facts.suspicious_concat_count;
                    }
                }
                break;
            default:
                break;
        }
        segment_has_tokens = true;
    }
    if (segment_has_tokens) {
        ++facts.statement_count;
        if (facts.statement_count == 1) {
            first_statement_end = code.size();
        }
    }
    if (unbalanced || depth != 0) {
        add_degraded(facts, DegradedReason::kUnbalancedParentheses);
    }

    // -- 첫 번째 구문 ----------------------------------------------------------
    std::size_t first_begin = 0;
    while (first_begin < code.size() && code[first_begin]->type == TokenType::kSemicolon) {
        ++first_begin;
    }
    facts.statement_type = classify_statement(code, first_begin, first_statement_end);
    facts.limit          = find_limit(code, first_begin, first_statement_end);
    if (first_statement_end > first_begin) {
        facts.statement_end = code[first_statement_end - 1]->end();
    }

    evaluate_constant_conditions(code, facts);
    collect_names(code, facts.keywords, facts.function_calls);

    // -- 주석 ------------------------------------------------------------------
    const auto& tokens = lex.tokens;
    for (std::size_t k = 0; k < tokens.size(); ++k) {
        const Token& tok = tokens[k];
        if (!tok.is_comment()) {
            continue;
        }
        facts.has_comment = true;
        switch (tok.type) {
            case TokenType::kLineComment: facts.has_line_comment = true; break;
            case TokenType::kHashComment: facts.has_hash_comment = true; break;
            default:                      facts.has_block_comment = true; break;
        }
        if (tok.type != TokenType::kBlockComment) {
            continue;
        }

        if (k > 0 && k + 1 < tokens.size()) {
            const Token& prev = tokens[k - 1];
            const Token& next = tokens[k + 1];
            const bool glued  = prev.end() == tok.offset && next.offset == tok.end();
            const auto wordish = [](const Token& t) {
                return t.type == TokenType::kWord || t.type == TokenType::kNumber;
            };
            if (glued && wordish(prev) && wordish(next)) {
                facts.comment_splits_word = true;
            }
        }

        if (tok.value.starts_with("/*!")) {
            facts.versioned_comment = true;
            const LexResult inner = SqlLexer::tokenize(versioned_comment_body(tok.value));
            TokenRefs inner_code;
            for (const auto& it : inner.tokens) {
                if (!it.is_comment()) {
                    inner_code.push_back(&it);
                }
            }
            collect_names(inner_code, facts.keywords, facts.function_calls);
        }
    }

    evaluate_quote_break(lex, code, facts);

    std::sort(facts.keywords.begin(), facts.keywords.end());
    facts.keywords.erase(std::unique(facts.keywords.begin(), facts.keywords.end()),
                         facts.keywords.end());

    return facts;
}

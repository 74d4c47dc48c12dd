#include "commitment.hpp"
#include "hashing.hpp"
#include "json.hpp"
#include <cassert>
#include <iostream>
#include <string>

using namespace ztgate;

namespace {

const std::string kOpenAiKey = "sk-" + std::string(48, 'a');

SecretMatch openai_match(const std::string& content) {
    size_t pos = content.find(kOpenAiKey);
    return SecretMatch{"OPENAI_API_KEY", kOpenAiKey, pos, pos + kOpenAiKey.size(), kPatternConfidence,
                       DetectorKind::Pattern};
}

bool is_hex(const std::string& s) {
    return s.find_first_not_of("0123456789abcdef") == std::string::npos;
}

} // namespace

void test_quorum_signals() {
    QuorumValidator one(1, 3.5);
    std::string content = "export OPENAI_API_KEY=" + kOpenAiKey;
    auto votes = one.score(openai_match(content), content);
    assert(votes.pattern_matched);
    assert(!votes.entropy_over_threshold);
    assert(votes.variable_name);
    assert(votes.count() == 2);
    assert(one.confirm(openai_match(content), content));

    QuorumValidator three(3, 3.5);
    assert(!three.confirm(openai_match(content), content));

    // Without a telling variable name only the pattern signal remains.
    std::string bare = "echo " + kOpenAiKey;
    QuorumValidator two(2, 3.5);
    assert(!two.confirm(openai_match(bare), bare));
    assert(one.confirm(openai_match(bare), bare));
    std::cout << "✓ quorum vote over independent signals\n";
}

void test_variable_names() {
    assert(QuorumValidator::names_sensitive_variable("DB_PASSWORD=hunter2", 12));
    assert(QuorumValidator::names_sensitive_variable(R"({"client_secret": "abc"})", 19));
    assert(QuorumValidator::names_sensitive_variable("curl --auth-token xyz", 18));
    assert(!QuorumValidator::names_sensitive_variable("echo xyz", 5));
    assert(!QuorumValidator::names_sensitive_variable("xyz", 0));
    std::cout << "✓ sensitive variable names\n";
}

void test_entropy_signal() {
    QuorumValidator v(1, 3.5);
    std::string token = "9fK2xQ7LmZp4Rt8WvB3nYc6HdJ1sGe5A";
    std::string content = "value " + token;
    SecretMatch m{std::string(kHighEntropyType), token, 6, 6 + token.size(), kEntropyConfidence,
                  DetectorKind::Entropy};
    auto votes = v.score(m, content);
    assert(!votes.pattern_matched);
    assert(votes.entropy_over_threshold);
    assert(!votes.variable_name);
    assert(v.confirm(m, content));
    std::cout << "✓ entropy signal\n";
}

void test_commitment_fields() {
    CommitmentBuilder builder;
    std::string content = "export OPENAI_API_KEY=" + kOpenAiKey;
    json::Object ctx;
    ctx["toolName"] = "Bash";
    ctx["parameter"] = "command";
    auto c = builder.commit(openai_match(content), "embedded_in_command#1", ctx);
    assert(c);
    assert(c->secret_hash == *sha256_hex(kOpenAiKey));
    assert(c->commitment_id.size() == 16 && is_hex(c->commitment_id));
    assert(c->masked_placeholder == "<MASKED_OPENAI_API_KEY_" + c->secret_hash.substr(0, 8) + ">");
    assert(c->secret_type == "OPENAI_API_KEY");
    assert(c->timestamp.size() == 27 && c->timestamp.back() == 'Z' && c->timestamp[10] == 'T');
    assert(c->context.at("toolName").as_string() == "Bash");
    assert(c->context.at("detector").as_string() == "pattern");

    std::string expected_id = sha256_hex("embedded_in_command#1:" + c->secret_hash + ":" + c->timestamp + ":" +
                                         builder.process_id())->substr(0, 16);
    assert(c->commitment_id == expected_id);

    // No serialized field carries the raw value.
    std::string serialized = json::dump(c->to_json());
    assert(serialized.find(kOpenAiKey) == std::string::npos);

    auto back = Commitment::from_json(c->to_json());
    assert(back.commitment_id == c->commitment_id);
    assert(back.secret_hash == c->secret_hash);
    std::cout << "✓ commitment fields\n";
}

void test_commitment_matches() {
    CommitmentBuilder builder;
    std::string content = "export OPENAI_API_KEY=" + kOpenAiKey;
    auto c = builder.commit(openai_match(content), "embedded_in_command#1", {});
    assert(c);

    auto same = builder.matches(*c, kOpenAiKey);
    assert(same && *same);
    auto other = builder.matches(*c, "sk-" + std::string(48, 'b'));
    assert(other && !*other);

    Commitment edited = *c;
    edited.masked_placeholder = "<MASKED_OPENAI_API_KEY>";
    auto tampered = builder.matches(edited, kOpenAiKey);
    assert(tampered && !*tampered);

    // A commitment read back from its JSON form still checks.
    auto doc = json::parse(json::dump(c->to_json()));
    assert(doc);
    auto again = builder.matches(Commitment::from_json(*doc), kOpenAiKey);
    assert(again && *again);
    std::cout << "✓ candidate values checked against commitments\n";
}

void test_hash_failure_propagates() {
    CommitmentBuilder failing([](std::string_view) -> std::expected<std::string, HashErrorInfo> {
        return std::unexpected(HashErrorInfo{HashError::DigestFailed, "digest unavailable"});
    });
    std::string content = "k=" + kOpenAiKey;
    auto c = failing.commit(openai_match(content), "embedded_in_command#1", {});
    assert(!c);
    assert(c.error().error == HashError::DigestFailed);
    std::cout << "✓ hashing failure surfaces as an error\n";
}

int main() {
    test_quorum_signals();
    test_variable_names();
    test_entropy_signal();
    test_commitment_fields();
    test_commitment_matches();
    test_hash_failure_propagates();
    std::cout << "All commitment tests passed\n";
    return 0;
}

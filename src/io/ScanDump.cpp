/***
 * Name: archlink::io::parseScanDump
 * Purpose: Turn scan dump text into class facts and raw access records.
 */
#include "archlink/io/ScanDump.h"
#include "archlink/exceptions/descriptor_error.h"
#include "archlink/exceptions/dump_parse_error.h"
#include "archlink/model/Descriptor.h"
#include "archlink/model/Modifiers.h"
#include "archlink/support/text.h"

#include <cstddef>
#include <utility>

namespace archlink::io {

namespace {

class DumpReader {
public:
    explicit DumpReader(const std::string &fileName) : file_(fileName) {}

    void readLine(std::string_view line, int lineNo);
    ScanDump finish() { return std::move(dump_); }

private:
    [[noreturn]] void fail(const std::string &message) const {
        throw exceptions::DumpParseError(file_ + ":" + std::to_string(lineNo_) + ": " + message);
    }

    std::string typeName(std::string_view raw) const;
    model::Modifiers modifierList(std::string_view list, std::vector<std::string> *annotations) const;

    void readClass(const std::vector<std::string> &words);
    void readMember(model::MemberKind kind, std::string name, std::string descriptor,
                    const std::vector<std::string> &words, std::size_t modsAt);
    void readAccess(const std::vector<std::string> &words);

    std::string file_;
    int lineNo_{0};
    ScanDump dump_{};
};

std::string DumpReader::typeName(const std::string_view raw) const {
    try {
        return model::ownerTypeName(raw);
    } catch (const exceptions::DescriptorError &e) {
        fail(std::string("malformed type name '") + std::string(raw) + "': " + e.what());
    }
}

model::Modifiers DumpReader::modifierList(const std::string_view list, std::vector<std::string> *annotations) const {
    model::Modifiers mods = 0;
    for (const auto &word : support::SplitList(list)) {
        if (word.front() == '@' && annotations != nullptr) {
            annotations->push_back(typeName(std::string_view(word).substr(1)));
            continue;
        }
        const auto flag = model::parseModifierWord(word);
        if (!flag) fail("unknown modifier '" + word + "'");
        mods |= *flag;
    }
    return mods;
}

void DumpReader::readClass(const std::vector<std::string> &words) {
    if (words.size() < 2) fail("class line needs a name");
    model::ClassInfo info;
    info.name = typeName(words[1]);
    for (std::size_t i = 2; i < words.size(); i += 2) {
        if (i + 1 >= words.size()) fail("'" + words[i] + "' needs a value");
        const std::string &key = words[i];
        const std::string &value = words[i + 1];
        if (key == "extends") {
            info.superclass = typeName(value);
        } else if (key == "implements") {
            for (const auto &iface : support::SplitList(value)) info.interfaces.push_back(typeName(iface));
        } else if (key == "modifiers") {
            info.modifiers = modifierList(value, nullptr);
        } else {
            fail("unexpected '" + key + "' on class line");
        }
    }
    dump_.classes.push_back(std::move(info));
}

void DumpReader::readMember(const model::MemberKind kind, std::string name, std::string descriptor,
                            const std::vector<std::string> &words, const std::size_t modsAt) {
    if (dump_.classes.empty()) fail(std::string(model::memberKindName(kind)) + " line before any class line");
    if (words.size() > modsAt + 1) fail("unexpected '" + words[modsAt + 1] + "' after modifiers");
    try {
        (void) model::signatureOf(kind, descriptor);
    } catch (const exceptions::DescriptorError &e) {
        fail(std::string("malformed descriptor '") + descriptor + "': " + e.what());
    }
    model::MemberInfo member;
    member.kind = kind;
    member.name = std::move(name);
    member.descriptor = std::move(descriptor);
    if (words.size() > modsAt) member.modifiers = modifierList(words[modsAt], &member.annotations);
    member.handle = model::MemberHandle{file_ + ":" + std::to_string(lineNo_)};
    dump_.classes.back().members.push_back(std::move(member));
}

void DumpReader::readAccess(const std::vector<std::string> &words) {
    if (words.size() != 9) fail("access line needs 8 fields");
    const model::CodeUnit caller{typeName(words[2]), words[3], words[4]};
    int line = -1;
    std::string err;
    if (!support::ParseIntStrict(words[8], line, &err)) fail("bad line number '" + words[8] + "': " + err);

    access::TargetInfo target;
    try {
        target = access::TargetInfo::of(words[5], words[6], words[7]);
    } catch (const exceptions::DescriptorError &e) {
        fail(std::string("malformed owner '") + words[5] + "': " + e.what());
    }

    const std::string &kind = words[1];
    if (kind == "get") {
        dump_.accesses.push_back(access::fieldAccess(caller, std::move(target), line, access::AccessType::Get));
    } else if (kind == "set") {
        dump_.accesses.push_back(access::fieldAccess(caller, std::move(target), line, access::AccessType::Set));
    } else if (kind == "call") {
        dump_.accesses.push_back(access::methodCall(caller, std::move(target), line));
    } else if (kind == "new") {
        dump_.accesses.push_back(access::constructorCall(caller, std::move(target), line));
    } else {
        fail("unknown access kind '" + kind + "'");
    }
}

void DumpReader::readLine(std::string_view line, const int lineNo) {
    lineNo_ = lineNo;
    if (const auto hash = line.find('#'); hash != std::string_view::npos) line = line.substr(0, hash);
    const auto words = support::SplitWords(line);
    if (words.empty()) return;

    const std::string &directive = words.front();
    if (directive == "class") {
        readClass(words);
    } else if (directive == "field" || directive == "method") {
        if (words.size() < 3) fail(directive + " line needs a name and a descriptor");
        const auto kind = directive == "field" ? model::MemberKind::Field : model::MemberKind::Method;
        readMember(kind, words[1], words[2], words, 3);
    } else if (directive == "constructor") {
        if (words.size() < 2) fail("constructor line needs a descriptor");
        readMember(model::MemberKind::Constructor, std::string(model::kConstructorName), words[1], words, 2);
    } else if (directive == "initializer") {
        readMember(model::MemberKind::Method, std::string(model::kStaticInitializerName), "()V", words, 1);
    } else if (directive == "access") {
        readAccess(words);
    } else {
        fail("unknown directive '" + directive + "'");
    }
}

} // namespace

ScanDump parseScanDump(std::string_view text, const std::string &fileName) {
    DumpReader reader(fileName);
    int lineNo = 0;
    while (!text.empty()) {
        ++lineNo;
        const std::size_t end = text.find('\n');
        std::string_view line = text.substr(0, end);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        reader.readLine(line, lineNo);
        if (end == std::string_view::npos) break;
        text.remove_prefix(end + 1);
    }
    return reader.finish();
}

} // namespace archlink::io

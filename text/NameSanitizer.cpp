#include "NameSanitizer.h"
#include "AsciiPolicy.h"
#include "TransliterationTable.h"
#include "Utf8Decoder.h"

namespace notox {

namespace {

void emit_ascii(NameBuilder& out, unsigned char b) {
    switch (classify_ascii(b)) {
        case AsciiClass::Collapse: out.collapse(); break;
        case AsciiClass::Period:   out.literal('.'); break;
        case AsciiClass::Literal:  out.literal(static_cast<char>(b)); break;
    }
}

void emit_scalar(NameBuilder& out, char32_t cp) {
    const Fold f = transliterate(cp);
    switch (f.action) {
        case FoldAction::Literal:      out.literal(f.ascii); break;
        case FoldAction::HyphenLike:   out.literal('-'); break;
        case FoldAction::Silent:       break;
        case FoldAction::Unrecognized: out.collapse(); break;
    }
}

} // namespace

SanitizedName NameSanitizer::sanitize(std::string_view component) const {
    NameBuilder out;
    Utf8Decoder dec(component);
    DecodedUnit unit;
    while (dec.next(unit)) {
        if (unit.kind == UnitKind::Ascii) emit_ascii(out, unit.byte);
        else emit_scalar(out, unit.scalar);
    }

    SanitizedName r;
    r.name = out.take();
    r.changed = (r.name != component);
    return r;
}

} // namespace notox

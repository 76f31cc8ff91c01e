#include "TransliterationTable.h"

#include <cstddef>
#include <string_view>
#include <unordered_map>

namespace notox {

namespace {

struct FoldGroup {
    std::u32string_view sources;
    std::string_view ascii;
};

// Every scalar in `sources` folds to `ascii`. No scalar appears twice.
constexpr FoldGroup kFoldGroups[] = {
    {U"AⒶＡÀÁÂẦẤẪẨÃĀĂẰ"
     U"ẮẴẲȦǠÄǞẢÅǺǍȀȂẠ"
     U"ẬẶḀĄȺⱯ", "A"},
    {U"Ꜳ", "AA"},
    {U"ÆǼǢ", "A"},
    {U"Ꜵ", "AO"},
    {U"Ꜷ", "AU"},
    {U"ꜸꜺ", "AV"},
    {U"Ꜽ", "AY"},
    {U"BⒷＢḂḄḆɃƂƁ", "B"},
    {U"CⒸＣĆĈĊČÇḈƇȻꜾ", "C"},
    {U"DⒹＤḊĎḌḐḒḎĐƋƊƉꝹ", "D"},
    {U"ǱǄ", "DZ"},
    {U"ǲǅ", "Dz"},
    {U"EⒺＥÈÉÊỀẾỄỂẼĒḔḖ"
     U"ĔĖËẺĚȄȆẸỆȨḜĘḘḚ"
     U"ƐƎ", "E"},
    {U"FⒻＦḞƑꝻ", "F"},
    {U"GⒼＧǴĜḠĞĠǦĢǤƓꞠꝽ"
     U"Ꝿ", "G"},
    {U"HⒽＨĤḢḦȞḤḨḪĦⱧⱵꞍ", "H"},
    {U"IⒾＩÌÍÎĨĪĬİÏḮỈǏ"
     U"ȈȊỊĮḬƗ", "I"},
    {U"JⒿＪĴɈ", "J"},
    {U"KⓀＫḰǨḲĶḴƘⱩꝀꝂꝄꞢ", "K"},
    {U"LⓁＬĿĹĽḶḸĻḼḺŁȽⱢ"
     U"ⱠꝈꝆꞀ", "L"},
    {U"Ǉ", "LJ"},
    {U"ǈ", "Lj"},
    {U"MⓂＭḾṀṂⱮƜ", "M"},
    {U"NⓃＮǸŃÑṄŇṆŅṊṈȠƝ"
     U"ꞐꞤ", "N"},
    {U"Ǌ", "NJ"},
    {U"ǋ", "Nj"},
    {U"OⓄＯÒÓÔỒỐỖỔÕṌȬṎ"
     U"ŌṐṒŎȮȰÖȪỎŐǑȌȎƠ"
     U"ỜỚỠỞỢỌỘǪǬØǾƆƟꝊ"
     U"Ꝍ", "O"},
    {U"Ƣ", "OI"},
    {U"Ꝏ", "OO"},
    {U"Ȣ", "OU"},
    {U"\x8C" U"Œ", "OE"},
    {U"\x9C" U"œ", "oe"},
    {U"PⓅＰṔṖƤⱣꝐꝒꝔ", "P"},
    {U"QⓆＱꝖꝘɊ", "Q"},
    {U"RⓇＲŔṘŘȐȒṚṜŖṞɌⱤ"
     U"ꝚꞦꞂ", "R"},
    {U"SⓈＳẞŚṤŜṠŠṦṢṨȘŞ"
     U"ⱾꞨꞄ", "S"},
    {U"TⓉＴṪŤṬȚŢṰṮŦƬƮȾ"
     U"Ꞇ", "T"},
    {U"Ꜩ", "TZ"},
    {U"UⓊＵÙÚÛŨṸŪṺŬÜǛǗ"
     U"ǕǙỦŮŰǓȔȖƯỪỨỮỬỰ"
     U"ỤṲŲṶṴɄ", "U"},
    {U"VⓋＶṼṾƲꝞɅ", "V"},
    {U"Ꝡ", "VY"},
    {U"WⓌＷẀẂŴẆẄẈⱲ", "W"},
    {U"XⓍＸẊẌ", "X"},
    {U"YⓎＹỲÝŶỸȲẎŸỶỴƳɎ"
     U"Ỿ", "Y"},
    {U"ZⓏＺŹẐŻŽẒẔƵȤⱿⱫꝢ", "Z"},
    {U"aⓐａẚàáâầấẫẩãāă"
     U"ằắẵẳȧǡäǟảåǻǎȁȃ"
     U"ạậặḁąⱥɐ", "a"},
    {U"ꜳ", "aa"},
    {U"æǽǣ", "a"},
    {U"ꜵ", "ao"},
    {U"ꜷ", "au"},
    {U"ꜹꜻ", "av"},
    {U"ꜽ", "ay"},
    {U"bⓑｂḃḅḇƀƃɓþ", "b"},
    {U"cⓒｃćĉċčçḉƈȼꜿↄ", "c"},
    {U"dⓓｄḋďḍḑḓḏđƌɖɗꝺ", "d"},
    {U"ǳǆ", "dz"},
    {U"eⓔｅèéêềếễểẽēḕḗ"
     U"ĕėëẻěȅȇẹệȩḝęḙḛ"
     U"ɇɛǝ", "e"},
    {U"fⓕｆḟƒꝼ", "f"},
    {U"gⓖｇǵĝḡğġǧģǥɠꞡᵹ"
     U"ꝿ", "g"},
    {U"hⓗｈĥḣḧȟḥḩḫẖħⱨⱶ"
     U"ɥ", "h"},
    {U"ƕ", "hv"},
    {U"iⓘｉìíîĩīĭïḯỉǐȉ"
     U"ȋịįḭɨı", "i"},
    {U"jⓙｊĵǰɉ", "j"},
    {U"kⓚｋḱǩḳķḵƙⱪꝁꝃꝅꞣ", "k"},
    {U"lⓛｌŀĺľḷḹļḽḻſłƚ"
     U"ɫⱡꝉꞁꝇ", "l"},
    {U"ǉ", "lj"},
    {U"mⓜｍḿṁṃɱɯ", "m"},
    {U"nⓝｎǹńñṅňṇņṋṉƞɲ"
     U"ŉꞑꞥ", "n"},
    {U"ǌ", "nj"},
    {U"oⓞｏòóôồốỗổõṍȭṏ"
     U"ōṑṓŏȯȱöȫỏőǒȍȏơ"
     U"ờớỡởợọộǫǭøǿɔꝋꝍ"
     U"ɵ", "o"},
    {U"ƣ", "oi"},
    {U"ȣ", "ou"},
    {U"ꝏ", "oo"},
    {U"pⓟｐṕṗƥᵽꝑꝓꝕ", "p"},
    {U"qⓠｑɋꝗꝙ", "q"},
    {U"rⓡｒŕṙřȑȓṛṝŗṟɍɽ"
     U"ꝛꞧꞃ", "r"},
    {U"sⓢｓßśṥŝṡšṧṣṩșş"
     U"ȿꞩꞅẛ", "s"},
    {U"tⓣｔṫẗťṭțţṱṯŧƭʈ"
     U"ⱦꞇ", "t"},
    {U"ꜩ", "tz"},
    {U"uⓤｕùúûũṹūṻŭüǜǘ"
     U"ǖǚủůűǔȕȗưừứữửự"
     U"ụṳųṷṵʉ", "u"},
    {U"vⓥｖṽṿʋꝟʌ", "v"},
    {U"ꝡ", "vy"},
    {U"wⓦｗẁẃŵẇẅẘẉⱳ", "w"},
    {U"xⓧｘẋẍ", "x"},
    {U"yⓨｙỳýŷỹȳẏÿỷẙỵƴ"
     U"ɏỿ", "y"},
    {U"zⓩｚźẑżžẓẕƶȥɀⱬꝣ", "z"},
};

const std::unordered_map<char32_t, std::string_view>& fold_index() {
    static const std::unordered_map<char32_t, std::string_view> index = [] {
        std::unordered_map<char32_t, std::string_view> m;
        std::size_t n = 0;
        for (const auto& g : kFoldGroups) n += g.sources.size();
        m.reserve(n);
        for (const auto& g : kFoldGroups)
            for (char32_t cp : g.sources) m.emplace(cp, g.ascii);
        return m;
    }();
    return index;
}

} // namespace

Fold transliterate(char32_t cp) {
    if (cp == kEnDash) return {FoldAction::HyphenLike, "-"};
    if (is_combining_mark(cp)) return {FoldAction::Silent, {}};

    const auto& index = fold_index();
    auto it = index.find(cp);
    if (it == index.end()) return {FoldAction::Unrecognized, {}};
    return {FoldAction::Literal, it->second};
}

} // namespace notox

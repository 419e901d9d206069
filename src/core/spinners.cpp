#include "termbar/core/spinners.hpp"
#include <stdexcept>
#include <string>

namespace termbar {
namespace core {

namespace {

const std::vector<std::vector<std::string>>& spinnerTable() {
    static const std::vector<std::vector<std::string>> table = {
        {"←", "↖", "↑", "↗", "→", "↘", "↓", "↙"},
        {"▁", "▃", "▄", "▅", "▆", "▇", "█", "▇", "▆", "▅", "▄", "▃", "▁"},
        {"▖", "▘", "▝", "▗"},
        {"┤", "┘", "┴", "└", "├", "┌", "┬", "┐"},
        {"◢", "◣", "◤", "◥"},
        {"◰", "◳", "◲", "◱"},
        {"◴", "◷", "◶", "◵"},
        {"◐", "◓", "◑", "◒"},
        {".", "o", "O", "@", "*"},
        {"|", "/", "-", "\\"},
        {"◡◡", "⊙⊙", "◠◠"},
        {"⣾", "⣽", "⣻", "⢿", "⡿", "⣟", "⣯", "⣷"},
        {">))'>", " >))'>", "  >))'>", "   >))'>", "    >))'>", "   <'((<", "  <'((<", " <'((<"},
        {"⠁", "⠂", "⠄", "⡀", "⢀", "⠠", "⠐", "⠈"},
        {"⠋", "⠙", "⠹", "⠸", "⠼", "⠴", "⠦", "⠧", "⠇", "⠏"},
        {"a", "b", "c", "d", "e", "f", "g", "h", "i", "j", "k", "l", "m",
         "n", "o", "p", "q", "r", "s", "t", "u", "v", "w", "x", "y", "z"},
        {"▉", "▊", "▋", "▌", "▍", "▎", "▏", "▎", "▍", "▌", "▋", "▊", "▉"},
        {"■", "□", "▪", "▫"},
        {"←", "↑", "→", "↓"},
        {"╫", "╪"},
        {"⇐", "⇖", "⇑", "⇗", "⇒", "⇘", "⇓", "⇙"},
        {"⠁", "⠁", "⠉", "⠙", "⠚", "⠒", "⠂", "⠂", "⠒", "⠲", "⠴", "⠤", "⠄", "⠄", "⠤",
         "⠠", "⠠", "⠤", "⠦", "⠖", "⠒", "⠐", "⠐", "⠒", "⠓", "⠋", "⠉", "⠈", "⠈"},
        {"⠈", "⠉", "⠋", "⠓", "⠒", "⠐", "⠐", "⠒", "⠖", "⠦", "⠤", "⠠", "⠠", "⠤", "⠦",
         "⠖", "⠒", "⠐", "⠐", "⠒", "⠓", "⠋", "⠉", "⠈"},
        {"⠁", "⠉", "⠙", "⠚", "⠒", "⠂", "⠂", "⠒", "⠲", "⠴", "⠤", "⠄", "⠄", "⠤", "⠴",
         "⠲", "⠒", "⠂", "⠂", "⠒", "⠚", "⠙", "⠉", "⠁"},
        {"⠋", "⠙", "⠚", "⠒", "⠂", "⠂", "⠒", "⠲", "⠴", "⠦", "⠖", "⠒", "⠐", "⠐", "⠒", "⠓", "⠋"},
        {"ｦ", "ｧ", "ｨ", "ｩ", "ｪ", "ｫ", "ｬ", "ｭ", "ｮ", "ｯ", "ｱ", "ｲ", "ｳ", "ｴ", "ｵ", "ｶ",
         "ｷ", "ｸ", "ｹ", "ｺ", "ｻ", "ｼ", "ｽ", "ｾ", "ｿ", "ﾀ", "ﾁ", "ﾂ", "ﾃ", "ﾄ", "ﾅ", "ﾆ",
         "ﾇ", "ﾈ", "ﾉ", "ﾊ", "ﾋ", "ﾌ", "ﾍ", "ﾎ", "ﾏ", "ﾐ", "ﾑ", "ﾒ", "ﾓ", "ﾔ", "ﾕ", "ﾖ",
         "ﾗ", "ﾘ", "ﾙ", "ﾚ", "ﾛ", "ﾜ", "ﾝ"},
        {".", "..", "..."},
        {"▁", "▂", "▃", "▄", "▅", "▆", "▇", "█", "▉", "▊", "▋", "▌", "▍", "▎", "▏",
         "▏", "▎", "▍", "▌", "▋", "▊", "▉", "█", "▇", "▆", "▅", "▄", "▃", "▂", "▁"},
        {".", "o", "O", "°", "O", "o", "."},
        {"+", "x"},
        {"v", "<", "^", ">"},
        {">>--->", " >>--->", "  >>--->", "   >>--->", "    >>--->", "    <---<<",
         "   <---<<", "  <---<<", " <---<<", "<---<<"},
        {"|", "||", "|||", "||||", "|||||", "|||||||", "||||||||", "|||||||",
         "||||||", "|||||", "||||", "|||", "||", "|"},
        {"[          ]", "[=         ]", "[==        ]", "[===       ]", "[====      ]",
         "[=====     ]", "[======    ]", "[=======   ]", "[========  ]", "[========= ]",
         "[==========]"},
        {"(*---------)", "(-*--------)", "(--*-------)", "(---*------)", "(----*-----)",
         "(-----*----)", "(------*---)", "(-------*--)", "(--------*-)", "(---------*)"},
        {"█▒▒▒▒▒▒▒▒▒", "███▒▒▒▒▒▒▒", "█████▒▒▒▒▒", "███████▒▒▒", "██████████"},
        {"[                    ]", "[=>                  ]", "[===>                ]",
         "[=====>              ]", "[======>             ]", "[========>           ]",
         "[==========>         ]", "[============>       ]", "[==============>     ]",
         "[================>   ]", "[==================> ]", "[===================>]"},
        {"🕐", "🕑", "🕒", "🕓", "🕔", "🕕", "🕖", "🕗", "🕘", "🕙", "🕚", "🕛"},
        {"🕐", "🕜", "🕑", "🕝", "🕒", "🕞", "🕓", "🕟", "🕔", "🕠", "🕕", "🕡",
         "🕖", "🕢", "🕗", "🕣", "🕘", "🕤", "🕙", "🕥", "🕚", "🕦", "🕛", "🕧"},
        {"🌍", "🌎", "🌏"},
        {"◜", "◝", "◞", "◟"},
        {"⬒", "⬔", "⬓", "⬕"},
        {"⬖", "⬘", "⬗", "⬙"},
        {"[>>>          >]", "[]>>>>        []", "[]  >>>>      []", "[]    >>>>    []",
         "[]      >>>>  []", "[]        >>>>[]", "[>>          >>]"},
        {"♠", "♣", "♥", "♦"},
        {"➞", "➟", "➠", "➡", "➠", "➟"},
        {"  |  ", " \\   ", "_    ", " \\   ", "  |  ", "   / ", "    _", "   / "},
        {"  . . . .", ".   . . .", ". .   . .", ". . .   .", ". . . .  ", ". . . . ."},
        {" |     ", "  /    ", "   _   ", "    \\  ", "     | ", "    \\  ", "   _   ", "  /    "},
        {"⎺", "⎻", "⎼", "⎽", "⎼", "⎻"},
        {"▹▹▹▹▹", "▸▹▹▹▹", "▹▸▹▹▹", "▹▹▸▹▹", "▹▹▹▸▹", "▹▹▹▹▸"},
        {"[    ]", "[   =]", "[  ==]", "[ ===]", "[====]", "[=== ]", "[==  ]", "[=   ]"},
        {"( ●    )", "(  ●   )", "(   ●  )", "(    ● )", "(     ●)", "(    ● )",
         "(   ●  )", "(  ●   )", "( ●    )"},
        {"✶", "✸", "✹", "✺", "✹", "✷"},
        {"▐|\\____________▌", "▐_|\\___________▌", "▐__|\\__________▌", "▐___|\\_________▌",
         "▐____|\\________▌", "▐_____|\\_______▌", "▐______|\\______▌", "▐_______|\\_____▌",
         "▐________|\\____▌", "▐_________|\\___▌", "▐__________|\\__▌", "▐___________|\\_▌",
         "▐____________|\\▌", "▐____________/|▌", "▐___________/|_▌", "▐__________/|__▌",
         "▐_________/|___▌", "▐________/|____▌", "▐_______/|_____▌", "▐______/|______▌",
         "▐_____/|_______▌", "▐____/|________▌", "▐___/|_________▌", "▐__/|__________▌",
         "▐_/|___________▌", "▐/|____________▌"},
        {"▐⠂       ▌", "▐⠈       ▌", "▐ ⠂      ▌", "▐ ⠠      ▌", "▐  ⡀     ▌", "▐  ⠠     ▌",
         "▐   ⠂    ▌", "▐   ⠈    ▌", "▐    ⠂   ▌", "▐    ⠠   ▌", "▐     ⡀  ▌", "▐     ⠠  ▌",
         "▐      ⠂ ▌", "▐      ⠈ ▌", "▐       ⠂▌", "▐       ⠠▌", "▐       ⡀▌", "▐      ⠠ ▌",
         "▐      ⠂ ▌", "▐     ⠈  ▌", "▐     ⠂  ▌", "▐    ⠠   ▌", "▐    ⡀   ▌", "▐   ⠠    ▌",
         "▐   ⠂    ▌", "▐  ⠈     ▌", "▐  ⠂     ▌", "▐ ⠠      ▌", "▐ ⡀      ▌", "▐⠠       ▌"},
        {"¿", "?"},
        {"⢹", "⢺", "⢼", "⣸", "⣇", "⡧", "⡗", "⡏"},
        {"⢄", "⢂", "⢁", "⡁", "⡈", "⡐", "⡠"},
        {".  ", ".. ", "...", " ..", "  .", "   "},
        {"▓", "▒", "░"},
        {"▌", "▀", "▐", "▄"},
        {"⊶", "⊷"},
        {"▪", "▫"},
        {"□", "■"},
        {"▮", "▯"},
        {"-", "=", "≡"},
        {"d", "q", "p", "b"},
        {"∙∙∙", "●∙∙", "∙●∙", "∙∙●", "∙∙∙"},
        {"🌑 ", "🌒 ", "🌓 ", "🌔 ", "🌕 ", "🌖 ", "🌗 ", "🌘 "},
        {"☗", "☖"},
        {"⧇", "⧆"},
        {"◉", "◎"},
        {"㊂", "㊀", "㊁"},
        {"ဝ", "၀"},
        {"⠈⠁", "⠈⠑", "⠈⠱", "⠈⡱", "⢀⡱", "⢄⡱", "⢄⡱", "⢆⡱", "⢎⡱", "⢎⡰", "⢎⡠", "⢎⡀",
         "⢎⠁", "⠎⠁", "⠊⠁"},
    };
    return table;
}

}

size_t spinnerCount() {
    return spinnerTable().size();
}

const std::vector<std::string>& spinnerFrames(int spinner_type) {
    const auto& table = spinnerTable();
    if (spinner_type < 0 || static_cast<size_t>(spinner_type) >= table.size()) {
        throw std::out_of_range("spinner type " + std::to_string(spinner_type) + " out of range");
    }
    return table[spinner_type];
}

}}

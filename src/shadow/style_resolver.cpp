#include <neumorph/shadow/style_resolver.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <unordered_map>

namespace neumorph::shadow {

namespace {

// Trim whitespace from both ends
std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r");
    return s.substr(start, end - start + 1);
}

// Convert string to lowercase
std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

// Parse a hex digit
int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

const std::unordered_map<std::string, Color>& named_colors() {
    static const std::unordered_map<std::string, Color> colors = {
        {"black",       {0, 0, 0, 255}},
        {"white",       {255, 255, 255, 255}},
        {"gray",        {128, 128, 128, 255}},
        {"grey",        {128, 128, 128, 255}},
        {"silver",      {192, 192, 192, 255}},
        {"transparent", {0, 0, 0, 0}},
    };
    return colors;
}

// Parse a whole string as a float; trailing garbage fails
std::optional<float> parse_number(const std::string& s) {
    if (s.empty()) return std::nullopt;
    char* end = nullptr;
    float value = std::strtof(s.c_str(), &end);
    if (end == s.c_str() || *end != '\0' || !std::isfinite(value)) return std::nullopt;
    return value;
}

} // anonymous namespace

ShadowStyle resolve_style(const Color& light_color, const Color& dark_color, float elevation,
                          const NeuShape& shape, LightSource light_source) {
    return ShadowStyle(light_color, dark_color, elevation, shape, light_source);
}

ShadowStyle resolve_style(const StyleBundle& bundle) {
    return ShadowStyle(bundle.light_color, bundle.dark_color, bundle.elevation,
                       bundle.shape, bundle.light_source);
}

ShadowStyle resolve_style(const RawStyleFields& fields, core::DiagnosticEmitter* diagnostics) {
    NeuShape shape = Flat{RoundedCorner{0}};
    bool variant_ok = fields.shape_variant == 0 || fields.shape_variant == 1;
    bool corner_ok = fields.corner_style == 0 || fields.corner_style == 1;
    if (variant_ok && corner_ok) {
        CornerStyle corner = RoundedCorner{fields.corner_radius};
        if (fields.corner_style == 1) corner = Oval{};
        shape = make_shape(fields.shape_variant == 1 ? ShapeVariant::Pressed : ShapeVariant::Flat,
                           corner);
    } else {
        core::emit_to(diagnostics, core::Severity::Warning, core::Stage::ResolveStyle,
                      "unrecognized shape " + std::to_string(fields.shape_variant) +
                      "/corner " + std::to_string(fields.corner_style) +
                      "; using flat rounded rect with radius 0");
    }

    LightSource light_source = LightSource::TopLeft;
    switch (fields.light_source) {
        case 0: light_source = LightSource::TopLeft; break;
        case 1: light_source = LightSource::TopRight; break;
        case 2: light_source = LightSource::BottomLeft; break;
        case 3: light_source = LightSource::BottomRight; break;
        default:
            core::emit_to(diagnostics, core::Severity::Warning, core::Stage::ResolveStyle,
                          "unrecognized light source " + std::to_string(fields.light_source) +
                          "; using top-left");
            break;
    }

    return ShadowStyle(Color::from_argb(fields.light_argb), Color::from_argb(fields.dark_argb),
                       fields.elevation, shape, light_source);
}

std::optional<LightSource> parse_light_source(const std::string& value) {
    std::string v = to_lower(trim(value));
    if (v == "top-left") return LightSource::TopLeft;
    if (v == "top-right") return LightSource::TopRight;
    if (v == "bottom-left") return LightSource::BottomLeft;
    if (v == "bottom-right") return LightSource::BottomRight;
    return std::nullopt;
}

std::optional<ShapeVariant> parse_shape_variant(const std::string& value) {
    std::string v = to_lower(trim(value));
    if (v == "flat") return ShapeVariant::Flat;
    if (v == "pressed") return ShapeVariant::Pressed;
    return std::nullopt;
}

std::optional<CornerStyle> parse_corner_style(const std::string& value) {
    std::string v = to_lower(trim(value));
    if (v == "oval") return CornerStyle{Oval{}};

    if (v.compare(0, 7, "rounded") != 0 || v.size() == 7) return std::nullopt;
    // The radius is set off by whitespace or wrapped in parentheses
    if (v[7] != '(' && !std::isspace(static_cast<unsigned char>(v[7]))) return std::nullopt;
    std::string arg = trim(v.substr(7));
    if (!arg.empty() && arg.front() == '(') {
        if (arg.back() != ')') return std::nullopt;
        arg = trim(arg.substr(1, arg.size() - 2));
    }
    auto radius = parse_elevation(arg);
    if (!radius) return std::nullopt;
    return CornerStyle{RoundedCorner{*radius}};
}

std::optional<Color> parse_color(const std::string& input) {
    std::string value = trim(to_lower(input));

    if (value.empty()) return std::nullopt;

    auto& colors = named_colors();
    auto it = colors.find(value);
    if (it != colors.end()) {
        return it->second;
    }

    if (value[0] != '#') return std::nullopt;
    std::string hex = value.substr(1);

    if (hex.length() == 3 || hex.length() == 4) {
        // #RGB / #RGBA -> each digit doubled
        int d[4] = {0, 0, 0, 15};
        for (size_t i = 0; i < hex.length(); i++) {
            d[i] = hex_digit(hex[i]);
            if (d[i] < 0) return std::nullopt;
        }
        return Color{
            static_cast<uint8_t>(d[0] * 17),
            static_cast<uint8_t>(d[1] * 17),
            static_cast<uint8_t>(d[2] * 17),
            static_cast<uint8_t>(d[3] * 17)
        };
    }

    if (hex.length() == 6 || hex.length() == 8) {
        int c[4] = {0, 0, 0, 255};
        for (size_t i = 0; i < hex.length() / 2; i++) {
            int hi = hex_digit(hex[i * 2]);
            int lo = hex_digit(hex[i * 2 + 1]);
            if (hi < 0 || lo < 0) return std::nullopt;
            c[i] = hi * 16 + lo;
        }
        return Color{
            static_cast<uint8_t>(c[0]),
            static_cast<uint8_t>(c[1]),
            static_cast<uint8_t>(c[2]),
            static_cast<uint8_t>(c[3])
        };
    }

    return std::nullopt;
}

std::optional<float> parse_elevation(const std::string& input) {
    std::string value = to_lower(trim(input));
    if (value.size() > 2) {
        std::string suffix = value.substr(value.size() - 2);
        if (suffix == "px" || suffix == "dp") value = trim(value.substr(0, value.size() - 2));
    }
    return parse_number(value);
}

const char* light_source_name(LightSource light_source) {
    switch (light_source) {
        case LightSource::TopLeft:     return "top-left";
        case LightSource::TopRight:    return "top-right";
        case LightSource::BottomLeft:  return "bottom-left";
        case LightSource::BottomRight: return "bottom-right";
    }
    return "unknown";
}

const char* shape_variant_name(ShapeVariant variant) {
    switch (variant) {
        case ShapeVariant::Flat:    return "flat";
        case ShapeVariant::Pressed: return "pressed";
    }
    return "unknown";
}

std::optional<ShadowStyle> parse_style_declarations(const std::string& text,
                                                    const ShadowStyle& base,
                                                    core::DiagnosticEmitter* diagnostics) {
    Color light = base.light_color();
    Color dark = base.dark_color();
    float elevation = base.elevation();
    ShapeVariant variant = base.variant();
    CornerStyle corner = base.corner();
    LightSource light_source = base.light_source();

    auto reject = [&](const std::string& message) -> std::optional<ShadowStyle> {
        core::emit_to(diagnostics, core::Severity::Error, core::Stage::ParseStyle, message);
        return std::nullopt;
    };

    size_t pos = 0;
    while (pos < text.size()) {
        size_t semi = text.find(';', pos);
        if (semi == std::string::npos) semi = text.size();
        std::string decl = trim(text.substr(pos, semi - pos));
        pos = semi + 1;
        if (decl.empty()) continue;

        size_t colon = decl.find(':');
        if (colon == std::string::npos) return reject("missing ':' in \"" + decl + "\"");
        std::string key = to_lower(trim(decl.substr(0, colon)));
        std::string value = trim(decl.substr(colon + 1));

        if (key == "light-color" || key == "dark-color") {
            auto color = parse_color(value);
            if (!color) return reject("invalid color \"" + value + "\" for " + key);
            (key == "light-color" ? light : dark) = *color;
        } else if (key == "elevation") {
            auto e = parse_elevation(value);
            if (!e) return reject("invalid elevation \"" + value + "\"");
            elevation = *e;
        } else if (key == "light-source") {
            auto ls = parse_light_source(value);
            if (!ls) return reject("invalid light source \"" + value + "\"");
            light_source = *ls;
        } else if (key == "shape") {
            auto sv = parse_shape_variant(value);
            if (!sv) return reject("invalid shape \"" + value + "\"");
            variant = *sv;
        } else if (key == "corner") {
            auto cs = parse_corner_style(value);
            if (!cs) return reject("invalid corner \"" + value + "\"");
            corner = *cs;
        } else {
            return reject("unknown property \"" + key + "\"");
        }
    }

    return ShadowStyle(light, dark, elevation, make_shape(variant, corner), light_source);
}

} // namespace neumorph::shadow

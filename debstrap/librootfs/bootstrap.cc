#include "debstrap/librootfs/bootstrap.hh"
#include "debstrap/librootfs/errors.hh"
#include "debstrap/librootfs/json-fields.hh"
#include "debstrap/libutil/json.hh"
#include "debstrap/libutil/logging.hh"
#include "debstrap/libutil/strings.hh"

#include <algorithm>

namespace debstrap {

namespace {

/**
 * Accumulates command line arguments, skipping empty values.
 */
class ArgsBuilder
{
    Strings args;

public:
    void arg(std::string a)
    {
        args.push_back(std::move(a));
    }

    void flag(std::string_view f)
    {
        args.emplace_back(f);
    }

    void separate(std::string_view f, const std::string & value)
    {
        if (value.empty()) return;
        args.emplace_back(f);
        args.push_back(value);
    }

    void equals(std::string_view f, const std::string & value)
    {
        if (value.empty()) return;
        args.push_back(std::string(f) + "=" + value);
    }

    void separateEach(std::string_view f, const Strings & values)
    {
        for (auto & v : values)
            separate(f, v);
    }

    Strings finish()
    {
        return std::move(args);
    }
};

}

static const char * const archiveExtensions[] = {"tar", "gz", "bz2", "xz", "zst", "squashfs", "ext2", "img"};

static const StringSet mmdebstrapModes = {"auto", "sudo", "root", "unshare", "fakeroot", "fakechroot", "chrootless"};
static const StringSet mmdebstrapFormats = {
    "auto", "directory", "tar", "tar.xz", "tar.gz", "tar.zst", "squashfs", "ext2", "null"};
static const StringSet mmdebstrapVariants = {
    "debootstrap", "extract", "custom", "essential", "apt", "buildd", "required", "minbase", "important", "standard"};
static const StringSet debootstrapVariants = {"minbase", "buildd", "fakechroot", "scratchbox"};

static std::string enumField(
    const JSON & json, const std::string & key, std::string_view what, const StringSet & allowed, const std::string & def)
{
    auto value = optionalStringField(json, key, what).value_or(def);
    if (value.empty())
        value = def;
    if (!allowed.contains(value))
        throw ConfigError(
            "unknown %s '%s' in %s, expected one of: %s",
            key, value, what, concatStringsSep(", ", allowed));
    return value;
}

static Strings nonBlank(const Strings & ss)
{
    Strings res;
    for (auto & s : ss)
        if (!trim(s).empty())
            res.push_back(s);
    return res;
}

Strings MmdebstrapConfig::buildArgs(const Path & outputDir) const
{
    ArgsBuilder b;

    if (mode != "auto") b.separate("--mode", mode);
    if (format != "auto") b.separate("--format", format);
    if (variant != "debootstrap") b.separate("--variant", variant);

    b.separate("--architectures", concatStringsSep(",", architectures));
    b.separate("--components", concatStringsSep(",", components));
    b.separate("--include", concatStringsSep(",", include));

    b.separateEach("--keyring", keyring);
    b.separateEach("--aptopt", aptopt);
    b.separateEach("--dpkgopt", dpkgopt);

    b.separateEach("--setup-hook", setupHook);
    b.separateEach("--extract-hook", extractHook);
    b.separateEach("--essential-hook", essentialHook);
    b.separateEach("--customize-hook", customizeHook);

    b.arg(suite);
    b.arg(outputDir + "/" + target);

    auto args = b.finish();
    args.splice(args.end(), nonBlank(mirrors));

    debug("mmdebstrap would run: mmdebstrap %s", concatStringsSep(" ", args));
    return args;
}

/**
 * The extension of the last path component, or the name of a dot-file
 * like `.tar` with no other dots.
 */
static std::optional<std::string> extensionOf(std::string_view path)
{
    auto slash = path.rfind('/');
    auto name = slash == path.npos ? path : path.substr(slash + 1);
    auto dot = name.rfind('.');
    if (dot == name.npos) return std::nullopt;
    if (dot == 0) {
        auto stripped = name.substr(1);
        if (stripped.empty()) return std::nullopt;
        return std::string(stripped);
    }
    if (dot + 1 == name.size()) return std::nullopt;
    return std::string(name.substr(dot + 1));
}

RootfsOutput MmdebstrapConfig::rootfsOutput(const Path & outputDir) const
{
    auto targetPath = outputDir + "/" + target;

    if (format == "directory")
        return {RootfsOutput::Directory{targetPath}};

    if (format == "auto") {
        if (auto ext = extensionOf(targetPath)) {
            auto lower = toLower(*ext);
            if (std::find(std::begin(archiveExtensions), std::end(archiveExtensions), lower)
                != std::end(archiveExtensions))
                return {RootfsOutput::NonDirectory{
                    fmt("archive format detected based on extension: %s", *ext)}};
        }
        return {RootfsOutput::Directory{targetPath}};
    }

    return {RootfsOutput::NonDirectory{fmt("non-directory format specified: %s", format)}};
}

MmdebstrapConfig MmdebstrapConfig::parse(const JSON & json)
{
    constexpr std::string_view what = "mmdebstrap settings";
    checkObjectFields(json, what, {
        "type", "privilege", "suite", "target", "mode", "format", "variant", "architectures", "components",
        "include", "keyring", "aptopt", "dpkgopt", "setup_hook", "extract_hook", "essential_hook",
        "customize_hook", "mirrors"});
    return MmdebstrapConfig{
        .suite = stringField(json, "suite", what),
        .target = stringField(json, "target", what),
        .mode = enumField(json, "mode", what, mmdebstrapModes, "auto"),
        .format = enumField(json, "format", what, mmdebstrapFormats, "auto"),
        .variant = enumField(json, "variant", what, mmdebstrapVariants, "debootstrap"),
        .architectures = stringListField(json, "architectures", what),
        .components = stringListField(json, "components", what),
        .include = stringListField(json, "include", what),
        .keyring = stringListField(json, "keyring", what),
        .aptopt = stringListField(json, "aptopt", what),
        .dpkgopt = stringListField(json, "dpkgopt", what),
        .setupHook = stringListField(json, "setup_hook", what),
        .extractHook = stringListField(json, "extract_hook", what),
        .essentialHook = stringListField(json, "essential_hook", what),
        .customizeHook = stringListField(json, "customize_hook", what),
        .mirrors = stringListField(json, "mirrors", what),
    };
}

JSON MmdebstrapConfig::toJSON() const
{
    auto res = JSON::object();
    res["type"] = "mmdebstrap";
    res["suite"] = suite;
    res["target"] = target;
    res["mode"] = mode;
    res["format"] = format;
    res["variant"] = variant;
    auto list = [&](const char * key, const Strings & ss) {
        if (!ss.empty()) res[key] = ss;
    };
    list("architectures", architectures);
    list("components", components);
    list("include", include);
    list("keyring", keyring);
    list("aptopt", aptopt);
    list("dpkgopt", dpkgopt);
    list("setup_hook", setupHook);
    list("extract_hook", extractHook);
    list("essential_hook", essentialHook);
    list("customize_hook", customizeHook);
    list("mirrors", mirrors);
    return res;
}

Strings DebootstrapConfig::buildArgs(const Path & outputDir) const
{
    ArgsBuilder b;

    if (arch) b.equals("--arch", *arch);
    if (variant != "minbase") b.equals("--variant", variant);
    b.equals("--components", concatStringsSep(",", components));
    b.equals("--include", concatStringsSep(",", include));
    b.equals("--exclude", concatStringsSep(",", exclude));

    if (foreign) b.flag("--foreign");
    if (mergedUsr) b.flag(*mergedUsr ? "--merged-usr" : "--no-merged-usr");
    if (noResolveDeps) b.flag("--no-resolve-deps");
    if (verbose) b.flag("--verbose");
    if (printDebs) b.flag("--print-debs");

    b.arg(suite);
    b.arg(outputDir + "/" + target);

    auto args = b.finish();
    if (mirror && !trim(*mirror).empty())
        args.push_back(*mirror);

    debug("debootstrap would run: debootstrap %s", concatStringsSep(" ", args));
    return args;
}

RootfsOutput DebootstrapConfig::rootfsOutput(const Path & outputDir) const
{
    return {RootfsOutput::Directory{outputDir + "/" + target}};
}

DebootstrapConfig DebootstrapConfig::parse(const JSON & json)
{
    constexpr std::string_view what = "debootstrap settings";
    checkObjectFields(json, what, {
        "type", "privilege", "suite", "target", "variant", "arch", "components", "include", "exclude",
        "mirror", "foreign", "merged_usr", "no_resolve_deps", "verbose", "print_debs"});

    std::optional<bool> mergedUsr;
    if (auto v = get(json, "merged_usr"); v && !v->is_null())
        mergedUsr = boolField(json, "merged_usr", what, false);

    return DebootstrapConfig{
        .suite = stringField(json, "suite", what),
        .target = stringField(json, "target", what),
        .variant = enumField(json, "variant", what, debootstrapVariants, "minbase"),
        .arch = optionalStringField(json, "arch", what),
        .components = stringListField(json, "components", what),
        .include = stringListField(json, "include", what),
        .exclude = stringListField(json, "exclude", what),
        .mirror = optionalStringField(json, "mirror", what),
        .foreign = boolField(json, "foreign", what, false),
        .mergedUsr = mergedUsr,
        .noResolveDeps = boolField(json, "no_resolve_deps", what, false),
        .verbose = boolField(json, "verbose", what, false),
        .printDebs = boolField(json, "print_debs", what, false),
    };
}

JSON DebootstrapConfig::toJSON() const
{
    auto res = JSON::object();
    res["type"] = "debootstrap";
    res["suite"] = suite;
    res["target"] = target;
    res["variant"] = variant;
    if (arch) res["arch"] = *arch;
    if (!components.empty()) res["components"] = components;
    if (!include.empty()) res["include"] = include;
    if (!exclude.empty()) res["exclude"] = exclude;
    if (mirror) res["mirror"] = *mirror;
    if (foreign) res["foreign"] = true;
    if (mergedUsr) res["merged_usr"] = *mergedUsr;
    if (noResolveDeps) res["no_resolve_deps"] = true;
    if (verbose) res["verbose"] = true;
    if (printDebs) res["print_debs"] = true;
    return res;
}

std::string_view Bootstrap::commandName() const
{
    return std::visit(overloaded {
        [](const MmdebstrapConfig &) { return std::string_view("mmdebstrap"); },
        [](const DebootstrapConfig &) { return std::string_view("debootstrap"); },
    }, raw);
}

Strings Bootstrap::buildArgs(const Path & outputDir) const
{
    return std::visit([&](auto & c) { return c.buildArgs(outputDir); }, raw);
}

RootfsOutput Bootstrap::rootfsOutput(const Path & outputDir) const
{
    return std::visit([&](auto & c) { return c.rootfsOutput(outputDir); }, raw);
}

CommandSpec Bootstrap::command(const Path & outputDir) const
{
    return CommandSpec{
        .command = std::string(commandName()),
        .args = buildArgs(outputDir),
        .privilege = privilege.resolvedMethod(),
    };
}

Bootstrap Bootstrap::parse(const JSON & json)
{
    auto type = stringField(json, "type", "bootstrap settings");
    auto privilege = get(json, "privilege");
    Bootstrap res{
        .raw = MmdebstrapConfig{},
        .privilege = privilege ? Privilege::parse(*privilege) : Privilege{},
    };
    if (type == "mmdebstrap")
        res.raw = MmdebstrapConfig::parse(json);
    else if (type == "debootstrap")
        res.raw = DebootstrapConfig::parse(json);
    else
        throw ConfigError("unknown bootstrap type '%s', expected 'mmdebstrap' or 'debootstrap'", type);
    return res;
}

JSON Bootstrap::toJSON() const
{
    auto res = std::visit([](auto & c) { return c.toJSON(); }, raw);
    if (auto p = privilege.toJSON(); !p.is_null())
        res["privilege"] = p;
    return res;
}

}

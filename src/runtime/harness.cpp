#include "runtime/harness.hpp"
#include <nlohmann/json.hpp>

namespace mathviz::runtime {

namespace {

constexpr const char* CONFIG_PLACEHOLDER = "@MATHVIZ_CONFIG@";

const char* HARNESS_TEMPLATE = R"PY(import builtins as _builtins
import importlib as _importlib
import json as _json
import sys as _sys
import traceback as _traceback

_CONFIG = _json.loads(@MATHVIZ_CONFIG@)
_MARKER = _CONFIG["marker"]
_real_import = _builtins.__import__


def _module_allowed(name):
    top = name.split(".", 1)[0]
    if not name or top in _CONFIG["forbidden_modules"]:
        return False
    allowed = _CONFIG["allowed_modules"]
    return name in allowed or top in allowed


def _gated_import(name, globals=None, locals=None, fromlist=(), level=0):
    if level != 0:
        raise ImportError("relative imports are not allowed")
    if not _module_allowed(name):
        raise ImportError("import of module '%s' is not allowed" % name)
    return _real_import(name, globals, locals, fromlist, level)


def _namespace():
    safe = {}
    for name in _CONFIG["safe_builtins"]:
        if hasattr(_builtins, name):
            safe[name] = getattr(_builtins, name)
    safe["print"] = _builtins.print
    safe["__import__"] = _gated_import
    ns = {
        "__builtins__": safe,
        "__name__": "__main__",
        "output_path": _CONFIG["output_path"],
    }
    try:
        import matplotlib
        matplotlib.use("Agg")
    except ImportError as exc:
        print("matplotlib unavailable: %s" % exc, file=_sys.stderr)
    for binding, module in _CONFIG["preloaded_modules"].items():
        try:
            ns[binding] = _importlib.import_module(module)
        except ImportError as exc:
            print("preloaded module %s skipped: %s" % (module, exc), file=_sys.stderr)
    return ns


def _close_figures():
    pyplot = _sys.modules.get("matplotlib.pyplot")
    if pyplot is not None:
        pyplot.close("all")


def _main():
    ns = _namespace()
    try:
        code = compile(_CONFIG["code"], "<generated>", "exec")
        exec(code, ns)
    except MemoryError:
        _traceback.print_exc()
        return _CONFIG["memory_exit"]
    except BaseException:
        _traceback.print_exc()
        return 1
    finally:
        _close_figures()

    if "result" in ns:
        try:
            payload = _json.dumps(ns["result"], default=str, ensure_ascii=False)
        except (TypeError, ValueError) as exc:
            print("result not serializable: %s" % exc, file=_sys.stderr)
        else:
            _sys.stdout.write("\n" + _MARKER + payload + "\n")
    _sys.stdout.flush()
    return 0


_sys.exit(_main())
)PY";

} // anonymous namespace

std::string render_harness(const std::string& code,
                           const std::string& output_path,
                           const policy::SecurityPolicy& policy) {
    nlohmann::json config;
    config["code"] = code;
    config["output_path"] = output_path;
    config["marker"] = RESULT_MARKER;
    config["memory_exit"] = HARNESS_EXIT_MEMORY;
    config["allowed_modules"] = policy.allowed_modules;
    config["forbidden_modules"] = policy.forbidden_modules;
    config["safe_builtins"] = policy.safe_builtins;
    config["preloaded_modules"] = policy.preloaded_modules;

    // A JSON string is also a valid Python string literal
    using json = nlohmann::json;
    std::string config_text = config.dump(-1, ' ', false, json::error_handler_t::replace);
    std::string literal = json(config_text).dump(-1, ' ', false, json::error_handler_t::replace);

    std::string script = HARNESS_TEMPLATE;
    script.replace(script.find(CONFIG_PLACEHOLDER), std::string(CONFIG_PLACEHOLDER).size(), literal);
    return script;
}

} // namespace mathviz::runtime

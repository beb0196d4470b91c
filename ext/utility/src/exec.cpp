#include <asbridge/ext/exec.hpp>
#include <fstream>
#include <sstream>
#include <string>

namespace asbridge::ext
{
int load_string(
    AS_NAMESPACE_QUALIFIER asIScriptModule* m,
    const char* section_name,
    std::string_view code,
    int line_offset
)
{
    assert(m != nullptr);

    return m->AddScriptSection(
        section_name,
        code.data(),
        code.size(),
        line_offset
    );
}

int load_file(
    AS_NAMESPACE_QUALIFIER asIScriptModule* m,
    const std::filesystem::path& filename,
    std::ios_base::openmode mode
)
{
    assert(m != nullptr);

    std::string code;
    {
        std::ifstream ifs(filename, std::ios_base::in | mode);
        if(!ifs.good())
            return AS_NAMESPACE_QUALIFIER asERROR;

        std::stringstream ss;
        ss << ifs.rdbuf();
        code = std::move(ss).str();
    }

    std::string section = filename.string();
    return load_string(m, section.c_str(), code);
}

int exec(
    AS_NAMESPACE_QUALIFIER asIScriptEngine* engine,
    std::string_view code
)
{
    constexpr const char* module_name = "asbridge_exec";

    std::string func_code = string_concat("void ", module_name, "(){\n", code, "\n;}");

    auto* m = engine->GetModule(module_name, AS_NAMESPACE_QUALIFIER asGM_ALWAYS_CREATE);
    AS_NAMESPACE_QUALIFIER asIScriptFunction* f = nullptr;
    int r = m->CompileFunction(module_name, func_code.c_str(), -1, 0, &f);
    if(r < 0)
        return r;

    script_callback<void()> cb(f);
    // The callback holds its own reference
    f->Release();

    cb();
    return AS_NAMESPACE_QUALIFIER asSUCCESS;
}
} // namespace asbridge::ext

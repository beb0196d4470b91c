#include <asbridge/ext/stdstring.hpp>
#include <charconv>
#include <cstdint>

namespace asbridge::ext
{
void configure_engine_for_ext_string(
    AS_NAMESPACE_QUALIFIER asIScriptEngine* engine
)
{
    engine->SetEngineProperty(
        AS_NAMESPACE_QUALIFIER asEP_SCRIPT_SCANNER, 1 // UTF-8
    );
    engine->SetEngineProperty(
        AS_NAMESPACE_QUALIFIER asEP_STRING_ENCODING, 0 // UTF-8
    );
}

const void* string_factory::GetStringConstant(
    const char* data, AS_NAMESPACE_QUALIFIER asUINT length
)
{
    std::lock_guard lock(as_exclusive_lock);

    std::string_view view(data, length);
    auto it = m_cache.find(view);
    if(it != m_cache.end())
        it->second += 1;
    else
    {
        try
        {
            it = m_cache.emplace(std::string(view), 1).first;
        }
        catch(const std::bad_alloc&)
        {
            set_script_exception("failed to create string constant");
            return nullptr;
        }
    }

    return &it->first;
}

int string_factory::ReleaseStringConstant(const void* str)
{
    auto* ptr = static_cast<const std::string*>(str);
    if(!ptr) [[unlikely]]
        return AS_NAMESPACE_QUALIFIER asERROR;

    std::lock_guard lock(as_exclusive_lock);

    auto it = m_cache.find(*ptr);
    if(it == m_cache.end())
        return AS_NAMESPACE_QUALIFIER asERROR;

    assert(it->second != 0);
    if(--it->second == 0)
        m_cache.erase(it);

    return AS_NAMESPACE_QUALIFIER asSUCCESS;
}

int string_factory::GetRawStringData(
    const void* str, char* data, AS_NAMESPACE_QUALIFIER asUINT* length
) const
{
    auto* ptr = static_cast<const std::string*>(str);
    if(!ptr)
        return AS_NAMESPACE_QUALIFIER asERROR;

    if(length)
        *length = static_cast<AS_NAMESPACE_QUALIFIER asUINT>(ptr->size());
    if(data)
        ptr->copy(data, ptr->size());
    return AS_NAMESPACE_QUALIFIER asSUCCESS;
}

string_factory& string_factory::get()
{
    static string_factory instance{};
    return instance;
}

namespace script_string
{
    using size_type = AS_NAMESPACE_QUALIFIER asUINT;

    static bool string_equals(const std::string& this_, const std::string& str)
    {
        return this_ == str;
    }

    static int string_cmp(const std::string& this_, const std::string& str)
    {
        int r = this_.compare(str);
        return r < 0 ? -1 : (r > 0 ? 1 : 0);
    }

    static std::string string_add(const std::string& this_, const std::string& str)
    {
        return string_concat(this_, str);
    }

    static std::string string_add_int(const std::string& this_, std::int64_t val)
    {
        return string_concat(this_, std::to_string(val));
    }

    static std::string string_add_int_r(const std::string& this_, std::int64_t val)
    {
        return string_concat(std::to_string(val), this_);
    }

    static void string_add_assign(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        auto* this_ = static_cast<std::string*>(gen->GetObject());
        *this_ += *static_cast<const std::string*>(gen->GetArgObject(0));
        gen->SetReturnAddress(this_);
    }

    static size_type string_length(const std::string& this_)
    {
        return static_cast<size_type>(utf8::u8_strlen(this_));
    }

    static size_type string_size_bytes(const std::string& this_)
    {
        return static_cast<size_type>(this_.size());
    }

    static bool string_empty(const std::string& this_)
    {
        return this_.empty();
    }

    static std::string string_substr(const std::string& this_, size_type pos, size_type len)
    {
        std::size_t n = len == size_type(-1) ? std::size_t(-1) : len;
        return std::string(utf8::u8_substr(this_, pos, n));
    }

    static bool string_starts_with(const std::string& this_, const std::string& str)
    {
        return this_.starts_with(str);
    }

    static bool string_ends_with(const std::string& this_, const std::string& str)
    {
        return this_.ends_with(str);
    }

    static bool string_contains(const std::string& this_, const std::string& str)
    {
        return this_.find(str) != std::string::npos;
    }
} // namespace script_string

void register_std_string(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine)
{
    using namespace script_string;

    assert(
        engine->GetEngineProperty(AS_NAMESPACE_QUALIFIER asEP_STRING_ENCODING) == 0 &&
        "String extension requires UTF-8 encoding"
    );

    value_class<std::string> c(engine, "string");
    c
        .behaviours_by_traits()
        .as_string(&string_factory::get())
        .method("bool opEquals(const string&in str) const", fp<&string_equals>)
        .method("int opCmp(const string&in str) const", fp<&string_cmp>)
        .method("string opAdd(const string&in str) const", fp<&string_add>)
        .method("string opAdd(int64 val) const", fp<&string_add_int>)
        .method("string opAdd_r(int64 val) const", fp<&string_add_int_r>)
        .method("string& opAddAssign(const string&in str)", &string_add_assign)
        .method("uint get_length() const property", fp<&string_length>)
        .method("uint get_size_bytes() const property", fp<&string_size_bytes>)
        .method("bool empty() const", fp<&string_empty>)
        .method("string substr(uint pos, uint len=uint(-1)) const", fp<&string_substr>)
        .method("bool starts_with(const string&in str) const", fp<&string_starts_with>)
        .method("bool ends_with(const string&in str) const", fp<&string_ends_with>)
        .method("bool contains(const string&in str) const", fp<&string_contains>);
}

static std::string script_bool_to_string(bool val)
{
    return val ? "true" : "false";
}

template <typename Number>
static std::string script_number_to_string(Number val)
{
    char buf[64];
    auto result = std::to_chars(buf, buf + sizeof(buf), val);
    if(result.ec != std::errc())
        throw std::runtime_error("to_string(): conversion failed");

    return std::string(buf, result.ptr);
}

void register_string_utils(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine)
{
    global(engine)
        .function("string to_string(bool val)", fp<&script_bool_to_string>)
        .function("string to_string(int64 val)", fp<&script_number_to_string<std::int64_t>>)
        .function("string to_string(uint64 val)", fp<&script_number_to_string<std::uint64_t>>)
        .function("string to_string(double val)", fp<&script_number_to_string<double>>);
}
} // namespace asbridge::ext

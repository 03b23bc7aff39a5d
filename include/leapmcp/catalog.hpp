#pragma once
#include "leapmcp/prompts/manager.hpp"
#include "leapmcp/resources/manager.hpp"
#include "leapmcp/tools/manager.hpp"
#include "leapmcp/types.hpp"

namespace leapmcp
{

/// Everything the server advertises. Built once at startup, then only read;
/// handlers share it by const reference.
struct Catalog
{
    Implementation server_info;
    tools::ToolManager tools;
    resources::ResourceManager resources;
    prompts::PromptManager prompts;
};

/// The compiled-in catalog: tools "echo" and "add", resource
/// "file:///example.txt" and prompt "hello".
Catalog make_catalog();

// Built-in entries, exposed for tests and for assembling custom catalogs.
tools::Tool make_echo_tool();
tools::Tool make_add_tool();
resources::Resource make_example_resource();
prompts::Prompt make_hello_prompt();

} // namespace leapmcp

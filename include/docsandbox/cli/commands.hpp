#pragma once

namespace docsandbox::cli {

int run_cli(int argc, char **argv);

} // namespace docsandbox::cli

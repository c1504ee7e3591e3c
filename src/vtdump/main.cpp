// SPDX-License-Identifier: Apache-2.0
#include <vtdump/VtDumpApp.h>

int main(int argc, char const* argv[])
{
    vtdump::VtDumpApp app;
    return app.run(argc, argv);
}

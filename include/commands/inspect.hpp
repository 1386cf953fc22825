#pragma once

int cmd_inspect(int argc, char** argv);

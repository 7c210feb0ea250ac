#pragma once

enum class ExitCode : int {
    Ok = 0,
    Config = 1,         // bad flags, no selector, layout index not configured
    Connection = 2,     // display unreachable or lost
    GroupRejected = 3,  // server refused a group change
};

/*
 * This file is part of bezflat, a cubic bezier curve flattening toolkit
 * Copyright (C) 2024 The bezflat authors
 * 
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 * 
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Affero General Public License for more details.
 * 
 * You should have received a copy of the GNU Affero General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#include <sys/types.h>
#include <unistd.h>
#include <string>
#include <iostream>
#include <iomanip>
#include <fstream>
#include <sstream>
#include <vector>
#include <cstdlib>
#include <filesystem>

#ifndef NOFORK
#include <pwd.h>
#include <subprocess.h>
#endif

#include "util.h"

using namespace std;

string bezflat::temp_file_path(const char *suffix) {
    ifstream rnd;
    rnd.open("/dev/urandom", ios::in | ios::binary);

    char fn_buf[8];
    rnd.read(fn_buf, sizeof(fn_buf));

    ostringstream out;
    out << "bezflat_";
    if (rnd.rdstate()) { /* no /dev/urandom, fall back to something that is at least unique per process */
        out << getpid();
    } else {
        for (size_t i=0; i<sizeof(fn_buf); i++) {
            out << setfill('0') << setw(2) << setbase(16) << static_cast<int>(fn_buf[i] & 0xff);
        }
    }
    out << suffix;

    filesystem::path base = filesystem::temp_directory_path();
    return (base / out.str()).native();
}

#ifndef NOFORK
int bezflat::run_cargo_command(const char *cmd_name, vector<string> &cmdline, const char *envvar) {
    vector<const char *> cmdline_c = {nullptr};
    for (string &s : cmdline) {
        cmdline_c.push_back(s.c_str());
    }
    cmdline_c.push_back(nullptr);

    const char *homedir;
    if ((homedir = getenv("HOME")) == NULL) {
        struct passwd *pw = getpwuid(getuid());
        homedir = pw ? pw->pw_dir : "";
    }
    string cargo_bin_dir = string(homedir) + "/.cargo/bin/" + cmd_name;

    bool found = false;
    int proc_rc = -1;
    for (int i=0; i<3; i++) {
        const char *envvar_val;
        switch (i) {
        case 0:
            if ((envvar_val = getenv(envvar)) == NULL) {
                continue;
            } else {
                cmdline_c[0] = envvar_val;
            }
            break;

        case 1:
            cmdline_c[0] = cmd_name;
            break;

        case 2:
            cmdline_c[0] = cargo_bin_dir.c_str();
            break;
        }

        struct subprocess_s subprocess;
        int rc = subprocess_create(cmdline_c.data(), subprocess_option_inherit_environment | subprocess_option_search_user_path, &subprocess);
        if (rc) {
            cerr << "Error calling " << cmd_name << endl;
            return EXIT_FAILURE;
        }

        proc_rc = -1;
        rc = subprocess_join(&subprocess, &proc_rc);
        if (rc) {
            cerr << "Error calling " << cmd_name << endl;
            return EXIT_FAILURE;
        }

        rc = subprocess_destroy(&subprocess);
        if (rc) {
            cerr << "Error calling " << cmd_name << endl;
            return EXIT_FAILURE;
        }

        /* exec failure in the child shows up as exit code 255. Only give up on the explicitly configured binary. */
        if (i > 0 && proc_rc == 255) {
            continue;
        }
        found = true;
        break;
    }

    if (!found) {
        cerr << "Error: Cannot find " << cmd_name << ". Is it installed and in $PATH?" << endl;
        return EXIT_FAILURE;
    }

    if (proc_rc) {
        cerr << "Error: " << cmd_name << " returned an error code: " << proc_rc << endl;
        return EXIT_FAILURE;
    }

    return 0;
}
#else
int bezflat::run_cargo_command(const char *cmd_name, vector<string> &cmdline, const char *envvar) {
    (void) cmdline, (void) envvar;
    cerr << "Error: Cannot spawn " << cmd_name << " subprocess since binary was built with fork/exec disabled (-DNOFORK=1)" << endl;
    return EXIT_FAILURE;
}
#endif

#ifndef OPTIONS_HPP
#define OPTIONS_HPP
/*
 * Licensed to the Apache Software Foundation (ASF) under one
 * or more contributor license agreements.  See the NOTICE file
 * distributed with this work for additional information
 * regarding copyright ownership.  The ASF licenses this file
 * to you under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in compliance
 * with the License.  You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing,
 * software distributed under the License is distributed on an
 * "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
 * KIND, either express or implied.  See the License for the
 * specific language governing permissions and limitations
 * under the License.
 */

#include <algorithm>
#include <cstdlib>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace example {
/** bad_option is thrown for option parsing errors */
struct bad_option : public std::runtime_error {
    bad_option(const std::string& s) : std::runtime_error(s) {}
};

/** Command-line parser for the example tools: boolean flags, integer
 * values and trailing operands.
 *
 * Options come first. Everything after the last option, or after "--",
 * is an operand, see operands().
 */
class options {
  public:
    options(int argc, char const * const * argv, const std::string& operand_usage=std::string()) :
        args_(argv, argv + argc), prog_(argc ? argv[0] : ""), operand_usage_(operand_usage), help_(false)
    {
        size_t slash = prog_.find_last_of("/\\");
        if (slash != std::string::npos)
            prog_ = prog_.substr(slash+1);
        add_flag(help_, 'h', "help", "Print the help message");
    }

    /** Sets flag when parse() is called if option is present. */
    void add_flag(bool& flag, char short_name, const std::string& long_name, const std::string& description) {
        flag = false;
        opts_.push_back(option(short_name, long_name, description, "", &flag, 0));
    }

    /** Sets value from the argument that follows the option, or from --name=value. */
    void add_value(int& value, char short_name, const std::string& long_name, const std::string& description, const std::string& var) {
        opts_.push_back(option(short_name, long_name, description, var, 0, &value));
    }

    /** Parse the command line and collect the operands.
     *@throws bad_option if there is a parsing error or unknown option.
     */
    void parse() {
        size_t i = 1;
        for (; i < args_.size() && args_[i].size() > 1 && args_[i][0] == '-'; ++i) {
            if (args_[i] == "--") {
                ++i;
                break;
            }
            i = apply(i);
        }
        if (help_) throw bad_option("");
        operands_.assign(args_.begin() + std::min(i, args_.size()), args_.end());
    }

    /** Arguments following the options, valid after parse() */
    const std::vector<std::string>& operands() const { return operands_; }

    /** Print a usage message */
  friend std::ostream& operator<<(std::ostream& os, const options& op) {
      os << std::endl << "usage: " << op.prog_ << " [options]";
      if (!op.operand_usage_.empty()) os << " " << op.operand_usage_;
      os << std::endl << std::endl << "options:" << std::endl;
      for (std::vector<option>::const_iterator i = op.opts_.begin(); i != op.opts_.end(); ++i) {
          os << "  -" << i->short_name;
          if (i->value) os << " " << i->var;
          os << ", --" << i->long_name;
          if (i->value) os << "=" << i->var;
          os << std::endl << "        " << i->description;
          if (i->value) os << " (default " << *i->value << ")";
          os << std::endl;
      }
      return os;
  }

  private:
    struct option {
        char short_name;
        std::string long_name, description, var;
        bool* flag;
        int* value;

        option(char s, const std::string& l, const std::string& d, const std::string& v, bool* f, int* n) :
            short_name(s), long_name(l), description(d), var(v), flag(f), value(n) {}
    };

    // Apply the option at args_[i], return the index of its last argument.
    size_t apply(size_t i) {
        const std::string& arg = args_[i];
        for (std::vector<option>::iterator o = opts_.begin(); o != opts_.end(); ++o) {
            const std::string short_form = std::string("-") + o->short_name;
            const std::string long_form = "--" + o->long_name;
            if (arg == short_form || arg == long_form) {
                if (o->flag) {
                    *o->flag = true;
                    return i;
                }
                if (i + 1 >= args_.size()) throw bad_option("missing value for " + arg);
                set_value(*o->value, arg, args_[i+1]);
                return i + 1;
            }
            if (o->value && arg.compare(0, long_form.size() + 1, long_form + "=") == 0) {
                set_value(*o->value, long_form, arg.substr(long_form.size() + 1));
                return i;
            }
        }
        throw bad_option("unknown option " + arg);
    }

    static void set_value(int& value, const std::string& opt, const std::string& s) {
        char* end = 0;
        long n = std::strtol(s.c_str(), &end, 10);
        if (s.empty() || *end != '\0' || n < 0 || n > 1000000)
            throw bad_option("bad value for " + opt + ": " + s);
        value = int(n);
    }

    std::vector<std::string> args_;
    std::string prog_;
    std::string operand_usage_;
    std::vector<option> opts_;
    std::vector<std::string> operands_;
    bool help_;
};
}

#endif // OPTIONS_HPP

#pragma once
#include <string>
#include <map>
#include <vector>
#include <stdexcept>

enum CLIArgType {
    CLI_ARG_TYPE_INVALID,
    CLI_ARG_TYPE_VOID,
    CLI_ARG_TYPE_BOOL,
    CLI_ARG_TYPE_INT,
    CLI_ARG_TYPE_FLOAT,
    CLI_ARG_TYPE_STRING
};

class CommandArgsParser;

class CLIArg {
public:
    CLIArg() {
        type = CLI_ARG_TYPE_INVALID;
    }

    CLIArg(char al, std::string desc) {
        alias = al;
        description = desc;
        type = CLI_ARG_TYPE_VOID;
    }

    CLIArg(char al, std::string desc, bool b) {
        alias = al;
        description = desc;
        type = CLI_ARG_TYPE_BOOL;
        bval = b;
    }

    CLIArg(char al, std::string desc, int i) {
        alias = al;
        description = desc;
        type = CLI_ARG_TYPE_INT;
        ival = i;
    }

    CLIArg(char al, std::string desc, double f) {
        alias = al;
        description = desc;
        type = CLI_ARG_TYPE_FLOAT;
        fval = f;
    }

    CLIArg(char al, std::string desc, std::string s) {
        alias = al;
        description = desc;
        type = CLI_ARG_TYPE_STRING;
        sval = s;
    }

    CLIArg(char al, std::string desc, const char* s) {
        alias = al;
        description = desc;
        type = CLI_ARG_TYPE_STRING;
        sval = s;
    }

    bool b() const {
        if (type != CLI_ARG_TYPE_BOOL && type != CLI_ARG_TYPE_VOID) { throw std::runtime_error("Not a bool"); }
        return bval;
    }

    int i() const {
        if (type != CLI_ARG_TYPE_INT) { throw std::runtime_error("Not an int"); }
        return ival;
    }

    double d() const {
        if (type != CLI_ARG_TYPE_FLOAT) { throw std::runtime_error("Not a float"); }
        return fval;
    }

    const std::string& s() const {
        if (type != CLI_ARG_TYPE_STRING) { throw std::runtime_error("Not a string"); }
        return sval;
    }

    // True if the value came from the command line rather than the default
    bool provided() const { return set; }

    friend CommandArgsParser;

    CLIArgType type;
    char alias = 0;
    std::string description;

private:
    bool bval = false;
    int ival = 0;
    std::string sval;
    double fval = 0.0;
    bool set = false;
};

class CommandArgsParser {
public:
    void define(char shortName, std::string name, std::string desc) {
        args[name] = CLIArg(shortName, desc);
        if (shortName) { aliases[shortName] = name; }
    }

    template<class T>
    void define(char shortName, std::string name, std::string desc, T defValue) {
        args[name] = CLIArg(shortName, desc, defValue);
        if (shortName) { aliases[shortName] = name; }
    }

    // Positional arguments are filled in the order they are defined
    void definePositional(std::string name, std::string desc) {
        positionalNames.push_back(name);
        positionalDescs.push_back(desc);
    }

    void defineAll();

    int parse(int argc, char* argv[]);
    void showHelp();

    CLIArg operator[](std::string name) {
        if (args.find(name) == args.end()) { throw std::runtime_error("Unknown argument " + name); }
        return args[name];
    }

    bool hasPositional(const std::string& name) const;
    const std::string& positional(const std::string& name) const;

private:
    std::map<std::string, CLIArg> args;
    std::map<char, std::string> aliases;
    std::vector<std::string> positionalNames;
    std::vector<std::string> positionalDescs;
    std::map<std::string, std::string> positionals;
};

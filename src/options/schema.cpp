/*
 * Static option schema - argforge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <argforge/options/schema.hpp>

namespace argforge::schema {

static OptionSpec flag(std::vector<std::string> names, std::string dest, std::string help) {
    return OptionSpec{std::move(names), std::move(dest), ValueType::Bool, std::move(help), false, OptionValue{false}};
}

static OptionSpec text(std::vector<std::string> names, std::string dest, std::string help, OptionValue def = {}) {
    return OptionSpec{std::move(names), std::move(dest), ValueType::String, std::move(help), false, std::move(def)};
}

static OptionSpec integer(std::vector<std::string> names, std::string dest, std::string help, OptionValue def = {}) {
    return OptionSpec{std::move(names), std::move(dest), ValueType::Integer, std::move(help), false, std::move(def)};
}

static OptionSpec real(std::vector<std::string> names, std::string dest, std::string help, OptionValue def = {}) {
    return OptionSpec{std::move(names), std::move(dest), ValueType::Float, std::move(help), false, std::move(def)};
}

static OptionSpec hidden(OptionSpec spec) { spec.hidden = true; return spec; }

static OptionValue num(std::int64_t n) { return OptionValue{n}; }

std::vector<OptionGroup> option_groups() {
    std::vector<OptionGroup> groups;

    groups.push_back({"", "", {
        flag({"-h", "--help"}, "help", "Show basic help message and exit"),
        flag({"-hh"}, "advancedHelp", "Show advanced help message and exit"),
        flag({"--version"}, "showVersion", "Show program's version number and exit"),
        integer({"-v"}, "verbose", "Verbosity level: 0-6 (default 1)", num(1)),
    }});

    groups.push_back({"Target", "At least one of these options has to be provided to define the target(s)", {
        text({"-u", "--url"}, "url", "Target URL (e.g. \"http://www.site.com/vuln.php?id=1\")"),
        text({"-d"}, "direct", "Connection string for direct database connection"),
        text({"-l"}, "logFile", "Parse target(s) from Burp or WebScarab proxy log file"),
        text({"-m"}, "bulkFile", "Scan multiple targets given in a textual file"),
        text({"-r"}, "requestFile", "Load HTTP request from a file"),
        text({"-g"}, "googleDork", "Process Google dork results as target URLs"),
        text({"-c"}, "configFile", "Load options from a configuration INI file"),
    }});

    groups.push_back({"Request", "These options can be used to specify how to connect to the target URL", {
        text({"-A", "--user-agent"}, "agent", "HTTP User-Agent header value"),
        text({"-H", "--header"}, "header", "Extra header (e.g. \"X-Forwarded-For: 127.0.0.1\")"),
        text({"--method"}, "method", "Force usage of given HTTP method (e.g. PUT)"),
        text({"--data"}, "data", "Data string to be sent through POST (e.g. \"id=1\")"),
        text({"--param-del"}, "paramDel", "Character used for splitting parameter values (e.g. &)"),
        text({"--cookie"}, "cookie", "HTTP Cookie header value (e.g. \"PHPSESSID=a8d127e..\")"),
        text({"--cookie-del"}, "cookieDel", "Character used for splitting cookie values (e.g. ;)"),
        text({"--live-cookies"}, "liveCookies", "Live cookies file used for loading up-to-date values"),
        text({"--load-cookies"}, "loadCookies", "File containing cookies in Netscape/wget format"),
        flag({"--drop-set-cookie"}, "dropSetCookie", "Ignore Set-Cookie header from response"),
        flag({"--http2"}, "http2", "Use HTTP version 2 (experimental)"),
        flag({"--mobile"}, "mobile", "Imitate smartphone through HTTP User-Agent header"),
        flag({"--random-agent"}, "randomAgent", "Use randomly selected HTTP User-Agent header value"),
        text({"--host"}, "host", "HTTP Host header value"),
        text({"--referer"}, "referer", "HTTP Referer header value"),
        text({"--headers"}, "headers", "Extra headers (e.g. \"Accept-Language: fr\\nETag: 123\")"),
        text({"--auth-type"}, "authType", "HTTP authentication type (Basic, Digest, Bearer, ...)"),
        text({"--auth-cred"}, "authCred", "HTTP authentication credentials (name:password)"),
        text({"--auth-file"}, "authFile", "HTTP authentication PEM cert/private key file"),
        text({"--abort-code"}, "abortCode", "Abort on (problematic) HTTP error code(s) (e.g. 401)"),
        text({"--ignore-code"}, "ignoreCode", "Ignore (problematic) HTTP error code(s) (e.g. 401)"),
        flag({"--ignore-proxy"}, "ignoreProxy", "Ignore system default proxy settings"),
        flag({"--ignore-redirects"}, "ignoreRedirects", "Ignore redirection attempts"),
        flag({"--ignore-timeouts"}, "ignoreTimeouts", "Ignore connection timeouts"),
        text({"--proxy"}, "proxy", "Use a proxy to connect to the target URL"),
        text({"--proxy-cred"}, "proxyCred", "Proxy authentication credentials (name:password)"),
        text({"--proxy-file"}, "proxyFile", "Load proxy list from a file"),
        integer({"--proxy-freq"}, "proxyFreq", "Requests between change of proxy from a given list"),
        flag({"--tor"}, "tor", "Use Tor anonymity network"),
        integer({"--tor-port"}, "torPort", "Set Tor proxy port other than default"),
        text({"--tor-type"}, "torType", "Set Tor proxy type (HTTP, SOCKS4 or SOCKS5 (default))", OptionValue{std::string("SOCKS5")}),
        flag({"--check-tor"}, "checkTor", "Check to see if Tor is used properly"),
        real({"--delay"}, "delay", "Delay in seconds between each HTTP request", OptionValue{0.0}),
        real({"--timeout"}, "timeout", "Seconds to wait before timeout connection (default 30)", OptionValue{30.0}),
        integer({"--retries"}, "retries", "Retries when the connection timeouts (default 3)", num(3)),
        text({"--retry-on"}, "retryOn", "Retry request on regexp matching content (e.g. \"drop\")"),
        text({"--randomize"}, "rParam", "Randomly change value for given parameter(s)"),
        text({"--safe-url"}, "safeUrl", "URL address to visit frequently during testing"),
        text({"--safe-post"}, "safePost", "POST data to send to a safe URL"),
        text({"--safe-req"}, "safeReqFile", "Load safe HTTP request from a file"),
        integer({"--safe-freq"}, "safeFreq", "Regular requests between visits to a safe URL", num(0)),
        flag({"--skip-urlencode"}, "skipUrlEncode", "Skip URL encoding of payload data"),
        text({"--csrf-token"}, "csrfToken", "Parameter used to hold anti-CSRF token"),
        text({"--csrf-url"}, "csrfUrl", "URL address to visit for extraction of anti-CSRF token"),
        text({"--csrf-method"}, "csrfMethod", "HTTP method to use during anti-CSRF token page visit"),
        text({"--csrf-data"}, "csrfData", "POST data to send during anti-CSRF token page visit"),
        integer({"--csrf-retries"}, "csrfRetries", "Retries for anti-CSRF token retrieval (default 0)", num(0)),
        flag({"--force-ssl"}, "forceSSL", "Force usage of SSL/HTTPS"),
        flag({"--chunked"}, "chunked", "Use HTTP chunked transfer encoded (POST) requests"),
        flag({"--hpp"}, "hpp", "Use HTTP parameter pollution method"),
        text({"--eval"}, "evalCode", "Evaluate provided code before the request"),
    }});

    groups.push_back({"Optimization", "These options can be used to optimize the performance", {
        flag({"-o"}, "optimize", "Turn on all optimization switches"),
        flag({"--predict-output"}, "predictOutput", "Predict common queries output"),
        flag({"--keep-alive"}, "keepAlive", "Use persistent HTTP(s) connections"),
        flag({"--null-connection"}, "nullConnection", "Retrieve page length without actual HTTP response body"),
        integer({"--threads"}, "threads", "Max number of concurrent HTTP(s) requests (default 1)", num(1)),
    }});

    groups.push_back({"Injection", "These options can be used to specify which parameters to test for, "
                                   "provide custom injection payloads and optional tampering scripts", {
        text({"-p"}, "testParameter", "Testable parameter(s)"),
        text({"--skip"}, "skip", "Skip testing for given parameter(s)"),
        flag({"--skip-static"}, "skipStatic", "Skip testing parameters that not appear to be dynamic"),
        text({"--param-exclude"}, "paramExclude", "Regexp to exclude parameters from testing (e.g. \"ses\")"),
        text({"--param-filter"}, "paramFilter", "Select testable parameter(s) by place (e.g. \"POST\")"),
        text({"--dbms"}, "dbms", "Force back-end DBMS to provided value"),
        text({"--dbms-cred"}, "dbmsCred", "DBMS authentication credentials (user:password)"),
        text({"--os"}, "os", "Force back-end DBMS operating system to provided value"),
        flag({"--invalid-bignum"}, "invalidBignum", "Use big numbers for invalidating values"),
        flag({"--invalid-logical"}, "invalidLogical", "Use logical operations for invalidating values"),
        flag({"--invalid-string"}, "invalidString", "Use random strings for invalidating values"),
        flag({"--no-cast"}, "noCast", "Turn off payload casting mechanism"),
        flag({"--no-escape"}, "noEscape", "Turn off string escaping mechanism"),
        text({"--prefix"}, "prefix", "Injection payload prefix string"),
        text({"--suffix"}, "suffix", "Injection payload suffix string"),
        text({"--tamper"}, "tamper", "Use given script(s) for tampering injection data"),
    }});

    groups.push_back({"Detection", "These options can be used to customize the detection phase", {
        integer({"--level"}, "level", "Level of tests to perform (1-5, default 1)", num(1)),
        integer({"--risk"}, "risk", "Risk of tests to perform (1-3, default 1)", num(1)),
        text({"--string"}, "string", "String to match when query is evaluated to True"),
        text({"--not-string"}, "notString", "String to match when query is evaluated to False"),
        text({"--regexp"}, "regexp", "Regexp to match when query is evaluated to True"),
        integer({"--code"}, "code", "HTTP code to match when query is evaluated to True"),
        flag({"--smart"}, "smart", "Perform thorough tests only if positive heuristic(s)"),
        flag({"--text-only"}, "textOnly", "Compare pages based only on the textual content"),
        flag({"--titles"}, "titles", "Compare pages based only on their titles"),
    }});

    groups.push_back({"Techniques", "These options can be used to tweak testing of specific SQL injection techniques", {
        text({"--technique"}, "technique", "SQL injection techniques to use (default \"BEUSTQ\")", OptionValue{std::string("BEUSTQ")}),
        integer({"--time-sec"}, "timeSec", "Seconds to delay the DBMS response (default 5)", num(5)),
        flag({"--disable-stats"}, "disableStats", "Disable the statistical model for detecting the delay"),
        text({"--union-cols"}, "uCols", "Range of columns to test for UNION query SQL injection"),
        text({"--union-char"}, "uChar", "Character to use for bruteforcing number of columns"),
        text({"--union-from"}, "uFrom", "Table to use in FROM part of UNION query SQL injection"),
        text({"--union-values"}, "uValues", "Column values to use for UNION query SQL injection"),
        text({"--dns-domain"}, "dnsDomain", "Domain name used for DNS exfiltration attack"),
        text({"--second-url"}, "secondUrl", "Resulting page URL searched for second-order response"),
        text({"--second-req"}, "secondReq", "Load second-order HTTP request from file"),
    }});

    groups.push_back({"Fingerprint", "", {
        flag({"-f", "--fingerprint"}, "extensiveFp", "Perform an extensive DBMS version fingerprint"),
    }});

    groups.push_back({"Enumeration", "These options can be used to enumerate the back-end database management "
                                     "system information, structure and data contained in the tables", {
        flag({"-a", "--all"}, "getAll", "Retrieve everything"),
        flag({"-b", "--banner"}, "getBanner", "Retrieve DBMS banner"),
        flag({"--current-user"}, "getCurrentUser", "Retrieve DBMS current user"),
        flag({"--current-db"}, "getCurrentDb", "Retrieve DBMS current database"),
        flag({"--hostname"}, "getHostname", "Retrieve DBMS server hostname"),
        flag({"--is-dba"}, "isDba", "Detect if the DBMS current user is DBA"),
        flag({"--users"}, "getUsers", "Enumerate DBMS users"),
        flag({"--passwords"}, "getPasswordHashes", "Enumerate DBMS users password hashes"),
        flag({"--privileges"}, "getPrivileges", "Enumerate DBMS users privileges"),
        flag({"--roles"}, "getRoles", "Enumerate DBMS users roles"),
        flag({"--dbs"}, "getDbs", "Enumerate DBMS databases"),
        flag({"--tables"}, "getTables", "Enumerate DBMS database tables"),
        flag({"--columns"}, "getColumns", "Enumerate DBMS database table columns"),
        flag({"--schema"}, "getSchema", "Enumerate DBMS schema"),
        flag({"--count"}, "getCount", "Retrieve number of entries for table(s)"),
        flag({"--dump"}, "dumpTable", "Dump DBMS database table entries"),
        flag({"--dump-all"}, "dumpAll", "Dump all DBMS databases tables entries"),
        flag({"--search"}, "search", "Search column(s), table(s) and/or database name(s)"),
        flag({"--comments"}, "getComments", "Check for DBMS comments during enumeration"),
        flag({"--statements"}, "getStatements", "Retrieve SQL statements being run on DBMS"),
        text({"-D"}, "db", "DBMS database to enumerate"),
        text({"-T"}, "tbl", "DBMS database table(s) to enumerate"),
        text({"-C"}, "col", "DBMS database table column(s) to enumerate"),
        text({"-X"}, "exclude", "DBMS database identifier(s) to not enumerate"),
        text({"-U"}, "user", "DBMS user to enumerate"),
        flag({"--exclude-sysdbs"}, "excludeSysDbs", "Exclude DBMS system databases when enumerating tables"),
        text({"--pivot-column"}, "pivotColumn", "Pivot column name"),
        text({"--where"}, "dumpWhere", "Use WHERE condition while table dumping"),
        integer({"--start"}, "limitStart", "First dump table entry to retrieve"),
        integer({"--stop"}, "limitStop", "Last dump table entry to retrieve"),
        integer({"--first"}, "firstChar", "First query output word character to retrieve"),
        integer({"--last"}, "lastChar", "Last query output word character to retrieve"),
        text({"--sql-query"}, "sqlQuery", "SQL statement to be executed"),
        flag({"--sql-shell"}, "sqlShell", "Prompt for an interactive SQL shell"),
        text({"--sql-file"}, "sqlFile", "Execute SQL statements from given file(s)"),
    }});

    groups.push_back({"Brute force", "These options can be used to run brute force checks", {
        flag({"--common-tables"}, "commonTables", "Check existence of common tables"),
        flag({"--common-columns"}, "commonColumns", "Check existence of common columns"),
        flag({"--common-files"}, "commonFiles", "Check existence of common files"),
    }});

    groups.push_back({"File system access", "These options can be used to access the back-end database "
                                            "management system underlying file system", {
        text({"--file-read"}, "fileRead", "Read a file from the back-end DBMS file system"),
        text({"--file-write"}, "fileWrite", "Write a local file on the back-end DBMS file system"),
        text({"--file-dest"}, "fileDest", "Back-end DBMS absolute filepath to write to"),
    }});

    groups.push_back({"Operating system access", "These options can be used to access the back-end database "
                                                 "management system underlying operating system", {
        text({"--os-cmd"}, "osCmd", "Execute an operating system command"),
        flag({"--os-shell"}, "osShell", "Prompt for an interactive operating system shell"),
        flag({"--os-pwn"}, "osPwn", "Prompt for an OOB shell, Meterpreter or VNC"),
        flag({"--priv-esc"}, "privEsc", "Database process user privilege escalation"),
        text({"--tmp-path"}, "tmpPath", "Remote absolute path of temporary files directory"),
    }});

    groups.push_back({"General", "These options can be used to set some general working parameters", {
        text({"-s"}, "sessionFile", "Load session from a stored (.sqlite) file"),
        text({"-t"}, "trafficFile", "Log all HTTP traffic into a textual file"),
        flag({"--abort-on-empty"}, "abortOnEmpty", "Abort data retrieval on empty results"),
        text({"--answers"}, "answers", "Set predefined answers (e.g. \"quit=N,follow=N\")"),
        text({"--base64"}, "base64Parameter", "Parameter(s) containing Base64 encoded data"),
        flag({"--batch"}, "batch", "Never ask for user input, use the default behavior"),
        text({"--binary-fields"}, "binaryFields", "Result fields having binary values (e.g. \"digest\")"),
        flag({"--check-internet"}, "checkInternet", "Check Internet connection before assessing the target"),
        flag({"--cleanup"}, "cleanup", "Clean up the DBMS from specific UDF and tables"),
        integer({"--crawl"}, "crawlDepth", "Crawl the website starting from the target URL"),
        text({"--crawl-exclude"}, "crawlExclude", "Regexp to exclude pages from crawling (e.g. \"logout\")"),
        text({"--csv-del"}, "csvDel", "Delimiting character used in CSV output (default \",\")", OptionValue{std::string(",")}),
        text({"--charset"}, "charset", "Blind SQL injection charset (e.g. \"0123456789abcdef\")"),
        text({"--dump-file"}, "dumpFile", "Store dumped data to a custom file"),
        text({"--dump-format"}, "dumpFormat", "Format of dumped data (CSV (default), HTML or SQLITE)", OptionValue{std::string("CSV")}),
        text({"--encoding"}, "encoding", "Character encoding used for data retrieval (e.g. GBK)"),
        flag({"--eta"}, "eta", "Display for each output the estimated time of arrival"),
        flag({"--flush-session"}, "flushSession", "Flush session files for current target"),
        flag({"--forms"}, "forms", "Parse and test forms on target URL"),
        flag({"--fresh-queries"}, "freshQueries", "Ignore query results stored in session file"),
        integer({"--gpage"}, "googlePage", "Use Google dork results from specified page number", num(1)),
        text({"--har"}, "harFile", "Log all HTTP traffic into a HAR file"),
        flag({"--hex"}, "hexConvert", "Use hex conversion during data retrieval"),
        text({"--output-dir"}, "outputDir", "Custom output directory path"),
        flag({"--parse-errors"}, "parseErrors", "Parse and display DBMS error messages from responses"),
        text({"--preprocess"}, "preprocess", "Use given script(s) for preprocessing (request)"),
        text({"--postprocess"}, "postprocess", "Use given script(s) for postprocessing (response)"),
        flag({"--repair"}, "repair", "Redump entries having unknown character marker (?)"),
        text({"--save"}, "saveConfig", "Save options to a configuration INI file"),
        text({"--scope"}, "scope", "Regexp for filtering targets"),
        flag({"--skip-heuristics"}, "skipHeuristics", "Skip heuristic detection of vulnerabilities"),
        flag({"--skip-waf"}, "skipWaf", "Skip heuristic detection of WAF/IPS protection"),
        text({"--table-prefix"}, "tablePrefix", "Prefix used for temporary tables (default: \"sqlmap\")", OptionValue{std::string("sqlmap")}),
        text({"--test-filter"}, "testFilter", "Select tests by payloads and/or titles (e.g. ROW)"),
        text({"--test-skip"}, "testSkip", "Skip tests by payloads and/or titles (e.g. BENCHMARK)"),
        real({"--time-limit"}, "timeLimit", "Run with a time limit in seconds (e.g. 3600)"),
        flag({"--unsafe-naming"}, "unsafeNaming", "Disable escaping of DBMS identifiers (e.g. \"user\")"),
        text({"--web-root"}, "webRoot", "Web server document root directory (e.g. \"/var/www\")"),
    }});

    groups.push_back({"Miscellaneous", "These options do not fit into any other category", {
        text({"-z"}, "mnemonics", "Use short mnemonics (e.g. \"flu,bat,ban,tec=EU\")"),
        text({"--alert"}, "alert", "Run host OS command(s) when SQL injection is found"),
        flag({"--beep"}, "beep", "Beep on question and/or when vulnerability is found"),
        flag({"--dependencies"}, "dependencies", "Check for missing (optional) dependencies"),
        flag({"--disable-coloring"}, "disableColoring", "Disable console output coloring"),
        flag({"--disable-hashing"}, "disableHashing", "Disable hash analysis on table dumps"),
        flag({"--list-tampers"}, "listTampers", "Display list of available tamper scripts"),
        flag({"--no-logging"}, "noLogging", "Disable logging to a file"),
        flag({"--no-truncate"}, "noTruncate", "Disable console output truncation (e.g. long entr...)"),
        flag({"--offline"}, "offline", "Work in offline mode (only use session data)"),
        flag({"--purge"}, "purge", "Safely remove all content from the data directory"),
        text({"--results-file"}, "resultsFile", "Location of CSV results file in multiple targets mode"),
        flag({"--shell"}, "shell", "Prompt for an interactive shell"),
        text({"--tmp-dir"}, "tmpDir", "Local directory for storing temporary files"),
        flag({"--unstable"}, "unstable", "Adjust options for unstable connections"),
        flag({"--update"}, "updateAll", "Update to the latest development version"),
        flag({"--wizard"}, "wizard", "Simple wizard interface for beginner users"),
    }});

    // Switches that are accepted on the command line but never listed.
    groups.push_back({"", "", {
        hidden(text({"--crack"}, "hashFile", "Load and crack hashes from a file (standalone)")),
        hidden(flag({"--dummy"}, "dummy", "Dummy target used in testing")),
        hidden(integer({"--murphy-rate"}, "murphyRate", "Simulate random errors at the given rate")),
        hidden(flag({"--debug"}, "debug", "Show debugging output")),
        hidden(flag({"--deprecations"}, "deprecations", "Show deprecation warnings")),
        hidden(flag({"--disable-multi"}, "disableMulti", "Disable multiprocessing")),
        hidden(flag({"--profile"}, "profile", "Profile the run")),
        hidden(text({"--force-dbms"}, "forceDbms", "Force the back-end DBMS")),
        hidden(flag({"--force-dns"}, "forceDns", "Force DNS exfiltration")),
        hidden(flag({"--force-partial"}, "forcePartial", "Force partial UNION")),
        hidden(flag({"--ignore-stdin"}, "ignoreStdin", "Do not read targets from standard input")),
        hidden(flag({"--non-interactive"}, "nonInteractive", "Never wait for a key press before exiting")),
        hidden(flag({"--smoke-test"}, "smokeTest", "Run the smoke test")),
        hidden(flag({"--vuln-test"}, "vulnTest", "Run the vulnerability test")),
        hidden(flag({"--disable-json"}, "disableJson", "Disable JSON parsing")),
        hidden(flag({"--api"}, "api", "Run as an API client")),
        hidden(text({"--taskid"}, "taskid", "API task identifier")),
        hidden(text({"--database"}, "database", "API database location")),
    }});

    return groups;
}

const std::set<std::string>& ignored_options() {
    static const std::set<std::string> opts = {"--compressed"};
    return opts;
}

const std::map<std::string, std::string>& deprecated_options() {
    static const std::map<std::string, std::string> opts = {
        {"--ignore-502", "use '--ignore-code' instead"},
        {"--identify-waf", "functionality being done automatically"},
    };
    return opts;
}

const std::map<std::string, std::string>& obsolete_options() {
    static const std::map<std::string, std::string> opts = {
        {"--replicate", "use '--dump-format=SQLITE' instead"},
        {"--no-unescape", "use '--no-escape' instead"},
        {"--binary", "use '--binary-fields' instead"},
        {"--auth-private", "use '--auth-file' instead"},
        {"--ignore-401", "use '--ignore-code' instead"},
        {"--second-order", "use '--second-url' instead"},
        {"--purge-output", "use '--purge' instead"},
        {"--sqlmap-shell", "use '--shell' instead"},
        {"--check-payload", ""},
        {"--check-waf", ""},
        {"--pickled-options", "use '--api -c ...' instead"},
    };
    return opts;
}

const std::set<std::string>& basic_help_items() {
    static const std::set<std::string> items = {
        "url", "googleDork", "data", "cookie", "randomAgent", "proxy", "testParameter", "dbms",
        "level", "risk", "technique", "getAll", "getBanner", "getCurrentUser", "getCurrentDb",
        "getPasswordHashes", "getDbs", "getTables", "getColumns", "getSchema", "dumpTable",
        "dumpAll", "db", "tbl", "col", "osShell", "osPwn", "batch", "checkTor", "flushSession",
        "tor", "shell", "wizard",
    };
    return items;
}

} // namespace argforge::schema

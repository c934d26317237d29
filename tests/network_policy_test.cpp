#include <gtest/gtest.h>

#include "sandbox/network_policy.hpp"

namespace autolab::sandbox {
namespace {

TEST(NetworkPolicyTest, FlagsNetworkImports) {
    EXPECT_TRUE(FindNetworkViolation("import socket\ns = socket.socket()").has_value());
    EXPECT_TRUE(FindNetworkViolation("x = 1\nfrom urllib.request import urlopen\n").has_value());
    EXPECT_TRUE(FindNetworkViolation("    import requests").has_value());
    EXPECT_EQ(FindNetworkViolation("import requests\n").value(), "import requests");
}

TEST(NetworkPolicyTest, FlagsShellDownloads) {
    EXPECT_TRUE(FindNetworkViolation("curl http://example.com").has_value());
    EXPECT_TRUE(FindNetworkViolation("exec 3<>/dev/tcp/1.2.3.4/80").has_value());
    EXPECT_TRUE(FindNetworkViolation("os.system('pip install numpy')").has_value());
}

TEST(NetworkPolicyTest, AllowsSelfContainedPrograms) {
    EXPECT_FALSE(FindNetworkViolation("import json\nimport math\nprint(json.dumps({'x': math.pi}))").has_value());
    EXPECT_FALSE(FindNetworkViolation("import sockets_are_fun_module_name_only").has_value());
    EXPECT_FALSE(FindNetworkViolation("# we do not use requests here\nprint(1)").has_value());
}

TEST(NetworkPolicyTest, BlocksDestructiveCommands) {
    EXPECT_TRUE(FindBlockedCommand("rm -rf / --no-preserve-root").has_value());
    EXPECT_TRUE(FindBlockedCommand("os.system('shutdown now')").has_value());
    EXPECT_FALSE(FindBlockedCommand("print('hello')").has_value());
}

TEST(NetworkPolicyTest, IgnoresIdentifiersCommentsAndStrings) {
    const std::string program =
        "from concurrent.futures import ThreadPoolExecutor\n"
        "ex = ThreadPoolExecutor(4)\n"
        "ex.shutdown()\n"
        "shutdown = True\n"
        "inc = 5\n"
        "sync = inc - 1\n"
        "print(inc - 1)\n"
        "# compare ssh key hashing speeds\n"
        "print('curl and wget are not used here')\n"
        "doc = \"\"\"\nrm -rf /\nkillall python\n\"\"\"\n";
    EXPECT_FALSE(FindNetworkViolation(program).has_value());
    EXPECT_FALSE(FindBlockedCommand(program).has_value());
    EXPECT_FALSE(FindNetworkViolation("text = '''\nimport socket\n'''\n").has_value());
    EXPECT_FALSE(FindBlockedCommand("def chown(path):\n    return path\nchown('a')\n").has_value());
}

TEST(NetworkPolicyTest, FlagsCommandsHandedToAShell) {
    EXPECT_EQ(FindNetworkViolation("import subprocess\nsubprocess.run([\"curl\", \"-s\", \"http://x\"])\n").value(),
              "curl");
    EXPECT_EQ(FindNetworkViolation("import os\nos.system('ls; wget http://x')\n").value(), "wget");
    EXPECT_EQ(FindNetworkViolation("cd /tmp && nc -z host 80\n").value(), "nc");
    EXPECT_EQ(FindBlockedCommand("import subprocess\nsubprocess.call('sudo reboot', shell=True)\n").value(), "sudo");
    EXPECT_EQ(FindBlockedCommand("killall python3\n").value(), "killall");
    EXPECT_TRUE(FindBlockedCommand("import shutil\nshutil.rmtree('/')\n").has_value());
    EXPECT_TRUE(FindBlockedCommand(":(){ :|:& };:").has_value());
    EXPECT_FALSE(FindBlockedCommand("rm -rf ./build\n").has_value());
}

TEST(NetworkPolicyTest, RecognisesFailureSignatures) {
    EXPECT_TRUE(LooksLikeNetworkFailure("OSError: [Errno 101] Network is unreachable"));
    EXPECT_TRUE(LooksLikeNetworkFailure("curl: (6) Could not resolve host: example.com"));
    EXPECT_FALSE(LooksLikeNetworkFailure("ZeroDivisionError: division by zero"));
    EXPECT_TRUE(LooksLikeAllocationFailure("Traceback...\nMemoryError"));
    EXPECT_TRUE(LooksLikeAllocationFailure("terminate called after throwing an instance of 'std::bad_alloc'"));
    EXPECT_FALSE(LooksLikeAllocationFailure("ValueError: bad value"));
}

}  // namespace
}  // namespace autolab::sandbox

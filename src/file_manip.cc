#include <cerrno>
#include <dirent.h>
#include <fcntl.h>
#include <gradelib/file_manip.hh>
#include <unistd.h>

static int remove_rat_impl(int dirfd, const char* path) noexcept {
    int fd = openat(dirfd, path, O_RDONLY | O_DIRECTORY | O_NOFOLLOW | O_CLOEXEC);
    if (fd == -1) {
        return unlinkat(dirfd, path, 0);
    }

    DIR* dir = fdopendir(fd);
    if (dir == nullptr) {
        close(fd);
        return unlinkat(dirfd, path, AT_REMOVEDIR);
    }

    int ec = 0;
    int rc = 0;
    errno = 0;
    while (dirent* file = readdir(dir)) {
        if (file->d_name[0] == '.' and
            (file->d_name[1] == '\0' or (file->d_name[1] == '.' and file->d_name[2] == '\0')))
        {
            continue;
        }

#ifdef _DIRENT_HAVE_D_TYPE
        if (file->d_type == DT_DIR || file->d_type == DT_UNKNOWN) {
#endif
            if (remove_rat_impl(fd, file->d_name)) {
                ec = errno;
                rc = -1;
                break;
            }
#ifdef _DIRENT_HAVE_D_TYPE
        } else if (unlinkat(fd, file->d_name, 0)) {
            ec = errno;
            rc = -1;
            break;
        }
#endif
        errno = 0;
    }
    if (rc == 0 and errno != 0) {
        ec = errno;
        rc = -1;
    }

    (void)closedir(dir);

    if (rc == -1) {
        errno = ec;
        return -1;
    }

    return unlinkat(dirfd, path, AT_REMOVEDIR);
}

int remove_r(const char* path) noexcept { return remove_rat_impl(AT_FDCWD, path); }

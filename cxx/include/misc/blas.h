#ifndef __BLAS_H
#define __BLAS_H
/* Prototypes for the Fortran 77 BLAS routines used by seisconv.  The
reference BLAS, OpenBLAS, and ATLAS all export the Fortran symbols with a
trailing underscore and arguments passed by reference.  The macros let
the library code call the routines by their Fortran names. */
#define dscal dscal_
#define daxpy daxpy_

extern "C" {
void dscal(const int& n, const double& a, double *x, const int& incx);
void daxpy(const int &n, const double& a, const double *x,const int& incx,
        double *y,const int& incy);
};

#endif
